#include "engine/FileDialog.hpp"
#include "engine/Log.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace neta {

namespace file_dialog {

std::vector<std::string> parseSelection(const std::string& output) {
    std::vector<std::string> paths;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            paths.push_back(line);
        }
    }
    return paths;
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace file_dialog

std::vector<std::string> NullFileDialog::pickFiles(const std::string& title) {
    LOG_WARN("FileDialog: no native dialog in this build, cannot open '{}'", title);
    return {};
}

#if defined(NETA_FILE_DIALOG_PORTAL) && defined(__linux__)

namespace {

constexpr const char* IMAGE_PATTERNS = "*.png *.jpg *.jpeg *.bmp *.gif *.tga *.qoi";

bool findOnPath(const std::string& program) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return false;

    std::istringstream stream(pathEnv);
    std::string dir;
    std::error_code ec;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) continue;
        if (std::filesystem::exists(std::filesystem::path(dir) / program, ec)) {
            return true;
        }
    }
    return false;
}

/// Run a command and capture its standard output
bool runCapture(const std::string& command, std::string& output, int& status) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return false;
    }

    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }
    status = pclose(pipe);
    return true;
}

} // namespace

PortalFileDialog::PortalFileDialog() {
    if (findOnPath("zenity")) {
        m_helper = "zenity";
    } else if (findOnPath("kdialog")) {
        m_helper = "kdialog";
    } else {
        LOG_WARN("FileDialog: neither zenity nor kdialog found on PATH");
    }
}

std::vector<std::string> PortalFileDialog::pickFiles(const std::string& title) {
    if (m_helper.empty()) {
        LOG_WARN("FileDialog: no portal helper available");
        return {};
    }

    using file_dialog::shellQuote;
    std::string command;
    if (m_helper == "zenity") {
        command = "zenity --file-selection --multiple"
                  " --separator=" + shellQuote("\n") +
                  " --title=" + shellQuote(title) +
                  " --file-filter=" + shellQuote(std::string("Images | ") + IMAGE_PATTERNS) +
                  " --file-filter=" + shellQuote("All files | *");
    } else {
        command = "kdialog --getopenfilename . " +
                  shellQuote(std::string("Images (") + IMAGE_PATTERNS + ")") +
                  " --multiple --separate-output --title " + shellQuote(title);
    }
    command += " 2>/dev/null";

    std::string output;
    int status = 0;
    if (!runCapture(command, output, status)) {
        LOG_ERROR("FileDialog: failed to launch {}", m_helper);
        return {};
    }

    auto paths = file_dialog::parseSelection(output);
    if (status != 0 && paths.empty()) {
        LOG_DEBUG("FileDialog: {} closed without a selection", m_helper);
        return {};
    }

    LOG_INFO("FileDialog: {} file(s) picked", paths.size());
    return paths;
}

std::unique_ptr<IFileDialog> createFileDialog() {
    return std::make_unique<PortalFileDialog>();
}

#else

std::unique_ptr<IFileDialog> createFileDialog() {
    return std::make_unique<NullFileDialog>();
}

#endif

} // namespace neta
