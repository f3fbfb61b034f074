#pragma once
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — provider registry for the F3 overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) while
// installing; DebugSystem evaluates every provider each render frame and
// draws the results grouped by section, in registration order.
//
// No engine dependencies.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    // Appends a row, creating the section on first use.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        if (auto* s = find_mut(section)) {
            s->rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    // nullptr if no row has been registered under that title yet.
    const Section* find(const std::string& title) const {
        for (const auto& s : sections_) {
            if (s.title == title) return &s;
        }
        return nullptr;
    }

    std::size_t row_count() const {
        std::size_t n = 0;
        for (const auto& s : sections_) n += s.rows.size();
        return n;
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    Section* find_mut(const std::string& title) {
        for (auto& s : sections_) {
            if (s.title == title) return &s;
        }
        return nullptr;
    }

    std::vector<Section> sections_;
};
