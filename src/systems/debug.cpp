#include "debug.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <algorithm>
#include <string>
#include <vector>

static constexpr int   PAD      = 8;
static constexpr int   MIN_W    = 230;
static constexpr int   ROW_H    = 15;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   LABEL_W  = 112;  // content-left to value column
static constexpr Color BG       = {20,  20,  20,  210};
static constexpr Color DIVIDER  = {80,  80,  80,  200};
static constexpr Color C_TITLE  = {160, 160, 160, 255};
static constexpr Color C_HEADER = {210, 190, 80,  255};
static constexpr Color C_LABEL  = {180, 180, 180, 255};
static constexpr Color C_VALUE  = {255, 255, 255, 255};

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (const auto* record = world.try_resource<InputRecord>()) {
        if (record->keys_pressed[KEY_F3]) panel->visible = !panel->visible;
    }
    if (!panel->visible) return;

    const auto& sections = panel->sections();

    // Providers are evaluated once per frame, up front, so the panel can be
    // sized to the widest value.
    std::vector<std::vector<std::string>> values;
    int value_w = 0;
    for (const auto& sec : sections) {
        values.emplace_back();
        for (const auto& row : sec.rows) {
            values.back().push_back(row.fn());
            value_w = std::max(value_w, MeasureText(values.back().back().c_str(), FONT_SM));
        }
    }

    const int panel_w   = std::max(MIN_W, PAD * 2 + 4 + LABEL_W + value_w);
    const int content_h = static_cast<int>(panel->row_count() + sections.size()) * ROW_H
                        + static_cast<int>(sections.size()) * 4;
    const int panel_h   = PAD + ROW_H + PAD + content_h + PAD;

    const int ox = 10, oy = 10;
    DrawRectangle(ox, oy, panel_w, panel_h, BG);
    DrawRectangleLines(ox, oy, panel_w, panel_h, DIVIDER);

    int cy = oy + PAD;
    DrawText("CONTROLLER", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + panel_w - PAD - MeasureText("[F3]", FONT_SM) - 2, cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    for (std::size_t s = 0; s < sections.size(); ++s) {
        DrawLine(ox + PAD, cy, ox + panel_w - PAD, cy, DIVIDER);
        cy += 4;
        DrawText(sections[s].title.c_str(), ox + PAD, cy, FONT_MD, C_HEADER);
        cy += ROW_H;

        for (std::size_t r = 0; r < sections[s].rows.size(); ++r) {
            DrawText(sections[s].rows[r].label.c_str(), ox + PAD + 4, cy, FONT_SM, C_LABEL);
            DrawText(values[s][r].c_str(), ox + PAD + 4 + LABEL_W, cy, FONT_SM, C_VALUE);
            cy += ROW_H;
        }
    }
}
