#pragma once

#include <memory>
#include <string>
#include <vector>

namespace neta {

/// Native multi-file picker
class IFileDialog {
public:
    virtual ~IFileDialog() = default;

    /// Block until the user picks files or cancels.
    /// Returns an empty list on cancel or failure.
    virtual std::vector<std::string> pickFiles(const std::string& title) = 0;

    virtual bool isAvailable() const = 0;
    virtual const char* backendName() const = 0;
};

/// Used where no native dialog exists (web, non-Linux builds without a backend)
class NullFileDialog : public IFileDialog {
public:
    std::vector<std::string> pickFiles(const std::string& title) override;
    bool isAvailable() const override { return false; }
    const char* backendName() const override { return "none"; }
};

#if defined(NETA_FILE_DIALOG_PORTAL) && defined(__linux__)
/// Desktop portal picker.  Runs the helper the desktop session provides
/// (zenity on GNOME-like desktops, kdialog on KDE) and reads the selection
/// from its standard output.
class PortalFileDialog : public IFileDialog {
public:
    PortalFileDialog();

    std::vector<std::string> pickFiles(const std::string& title) override;
    bool isAvailable() const override { return !m_helper.empty(); }
    const char* backendName() const override { return "portal"; }

private:
    std::string m_helper;  ///< "zenity", "kdialog" or empty
};
#endif

/// Create the dialog for the compiled-in backend
std::unique_ptr<IFileDialog> createFileDialog();

namespace file_dialog {

/// Split helper output into paths: one per line, trailing CR and blank
/// lines dropped.
std::vector<std::string> parseSelection(const std::string& output);

/// Quote a string for a POSIX shell command line
std::string shellQuote(const std::string& value);

} // namespace file_dialog

} // namespace neta
