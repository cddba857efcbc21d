#pragma once

#include "canvas/ImageFrames.hpp"
#include "canvas/Packing.hpp"
#include "canvas/Selection.hpp"
#include "engine/FileDialog.hpp"
#include "picking/PointerEvents.hpp"
#include "rendering/Texture.hpp"
#include "ui/UISystem.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace neta {

/// Images the menu is drawn with.  Any of them may be missing; the menu then
/// falls back to flat colors.
struct ContextMenuTheme {
    const Texture* background = nullptr;
    const Texture* buttonNormal = nullptr;
    const Texture* buttonPressed = nullptr;
    float sliceBorder = 8.0f;

    /// Load tile_0028 (background), tile_0015 (button) and tile_0016
    /// (pressed button) from `themeDir`
    static ContextMenuTheme load(TextureManager& textures, const std::string& themeDir);
};

/// Right-click menu with Add, Remove and Organize.
///
/// A secondary click anywhere opens it at the pointer, any other click on
/// the board hides it.  The frames it acts on are captured when it opens.
class ContextMenu {
public:
    static constexpr const char* SCREEN_NAME = "context_menu";
    static constexpr float BUTTON_WIDTH = 150.0f;
    static constexpr float BUTTON_HEIGHT = 35.0f;
    static constexpr int FONT_SIZE = 20;
    static constexpr float PADDING = 10.0f;

    using OrganizedCallback = std::function<void(const std::vector<Packing::ShapePosition>&)>;

    ContextMenu(Registry& registry, UISystem& ui, Selection& selection,
                FrameLoader& frames, IFileDialog& dialog)
        : m_registry(registry), m_ui(ui), m_selection(selection),
          m_frames(frames), m_dialog(dialog) {}

    ~ContextMenu();

    ContextMenu(const ContextMenu&) = delete;
    ContextMenu& operator=(const ContextMenu&) = delete;

    /// Build the menu screen and start listening for clicks
    void init(PointerEventRouter& router, const ContextMenuTheme& theme);

    void shutdown();

    /// Show the menu with its top-left corner at `position` (screen),
    /// acting on `targets`
    void open(Vec2 position, std::vector<Entity> targets);
    void hide();

    bool isOpen() const { return m_ui.isScreenVisible(SCREEN_NAME); }
    const std::vector<Entity>& getTargets() const { return m_targets; }

    /// Called after Organize with the packed shapes (for debug drawing)
    void setOnOrganized(OrganizedCallback callback) { m_onOrganized = std::move(callback); }

    // --- Menu actions ---

    /// Pick files with the native dialog and add them at the origin.
    /// Returns the number of frames created.
    size_t addFromDialog();
    void removeTargets();
    void organizeTargets();

    UIButton* getButton(const std::string& id);

private:
    std::shared_ptr<UIButton> makeButton(const std::string& id, const std::string& label,
                                         const ContextMenuTheme& theme, UICallback action);

    Registry& m_registry;
    UISystem& m_ui;
    Selection& m_selection;
    FrameLoader& m_frames;
    IFileDialog& m_dialog;

    PointerEventRouter* m_router = nullptr;
    size_t m_observerId = 0;

    std::shared_ptr<UIBox> m_root;
    std::vector<Entity> m_targets;
    OrganizedCallback m_onOrganized;
};

} // namespace neta
