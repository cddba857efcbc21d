#include "ui/ContextMenu.hpp"
#include "engine/Log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace neta {

namespace {

const Color MENU_TEXT_COLOR = Color::fromFloat(0.9f, 0.9f, 0.9f);

const Texture* loadThemeImage(TextureManager& textures, const std::string& themeDir,
                              const char* file) {
    fs::path path = fs::path(themeDir) / file;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        ASSET_LOG_WARN("UI theme image '{}' not found, using flat colors", path.string());
        return nullptr;
    }
    return textures.loadTexture(path.string());
}

} // namespace

ContextMenuTheme ContextMenuTheme::load(TextureManager& textures, const std::string& themeDir) {
    ContextMenuTheme theme;
    theme.background = loadThemeImage(textures, themeDir, "tile_0028.png");
    theme.buttonNormal = loadThemeImage(textures, themeDir, "tile_0015.png");
    theme.buttonPressed = loadThemeImage(textures, themeDir, "tile_0016.png");
    return theme;
}

ContextMenu::~ContextMenu() {
    shutdown();
}

void ContextMenu::init(PointerEventRouter& router, const ContextMenuTheme& theme) {
    m_root = std::make_shared<UIBox>("context_menu");
    auto& style = m_root->getStyle();
    style.position = PositionType::Absolute;
    style.flexDirection = FlexDirection::Column;
    style.padding = UIEdges(PADDING);
    style.backgroundImage = theme.background;
    style.imageSliceBorder = theme.sliceBorder;
    if (!theme.background) {
        style.backgroundColor = Color(45, 45, 55, 240);
    }

    m_root->addChild(makeButton("add", "Add", theme, [this]() { addFromDialog(); }));
    m_root->addChild(makeButton("remove", "Remove", theme, [this]() { removeTargets(); }));
    m_root->addChild(makeButton("organize", "Organize", theme, [this]() { organizeTargets(); }));

    m_ui.registerScreen(SCREEN_NAME, m_root);
    m_ui.setScreenZOrder(SCREEN_NAME, 100);

    m_router = &router;
    m_observerId = router.addObserver([this](PointerEvent& event) {
        if (event.type != PointerEventType::Click) return;
        if (event.button == MouseButton::Right) {
            open(event.position, m_selection.actionTargets());
        } else {
            hide();
        }
    });
}

void ContextMenu::shutdown() {
    if (m_router) {
        m_router->removeObserver(m_observerId);
        m_router = nullptr;
    }
}

std::shared_ptr<UIButton> ContextMenu::makeButton(const std::string& id, const std::string& label,
                                                  const ContextMenuTheme& theme, UICallback action) {
    auto button = std::make_shared<UIButton>(id, label);
    auto& style = button->getStyle();
    style.width = UIDimension::Fixed(BUTTON_WIDTH);
    style.height = UIDimension::Fixed(BUTTON_HEIGHT);
    style.padding = UIEdges(0.0f);
    style.fontSize = FONT_SIZE;
    style.textColor = MENU_TEXT_COLOR;
    if (theme.buttonNormal) {
        button->setImages(theme.buttonNormal, theme.buttonPressed, theme.sliceBorder);
    }

    button->setOnClick([this, action = std::move(action)]() {
        // Hide first: an action may open a modal dialog
        hide();
        action();
    });
    return button;
}

void ContextMenu::open(Vec2 position, std::vector<Entity> targets) {
    m_targets = std::move(targets);
    bool onCanvas = m_targets.empty();

    if (auto* add = getButton("add")) add->setVisible(onCanvas);
    if (auto* remove = getButton("remove")) remove->setVisible(!onCanvas);

    m_root->getStyle().left = position.x;
    m_root->getStyle().top = position.y;
    m_ui.showScreen(SCREEN_NAME);
    LOG_DEBUG("Context menu opened with {} targets", m_targets.size());
}

void ContextMenu::hide() {
    m_ui.hideScreen(SCREEN_NAME);
}

UIButton* ContextMenu::getButton(const std::string& id) {
    if (!m_root) return nullptr;
    return static_cast<UIButton*>(m_root->findById(id));
}

size_t ContextMenu::addFromDialog() {
    if (!m_dialog.isAvailable()) {
        LOG_WARN("No file dialog available ({} backend)", m_dialog.backendName());
        return 0;
    }

    auto files = m_dialog.pickFiles("Add images");
    for (const auto& file : files) {
        m_frames.spawnFrame(file);
    }
    LOG_INFO("Picked {} files", files.size());
    return files.size();
}

void ContextMenu::removeTargets() {
    m_selection.removeFrames(m_targets);
    m_targets.clear();
}

void ContextMenu::organizeTargets() {
    auto shapes = Packing::organizeFrames(m_registry, m_targets);
    if (m_onOrganized) {
        m_onOrganized(shapes);
    }
}

} // namespace neta
