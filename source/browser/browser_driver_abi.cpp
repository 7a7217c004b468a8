#include "browser/browser_driver_abi.hpp"

namespace browser_driver {

bool parse_engine_kind(const std::string &name, EngineKind &output_kind) {
    if (name == "chromium") {
        output_kind = EngineKind::Chromium;
        return true;
    }
    if (name == "firefox") {
        output_kind = EngineKind::Firefox;
        return true;
    }
    if (name == "webkit") {
        output_kind = EngineKind::Webkit;
        return true;
    }
    return false;
}

std::string engine_kind_name(EngineKind kind) {
    switch (kind) {
    case EngineKind::Chromium:
        return "chromium";
    case EngineKind::Firefox:
        return "firefox";
    case EngineKind::Webkit:
        return "webkit";
    }
    return "chromium";
}

Locator selector_locator(const std::string &selector) {
    Locator locator;
    locator.kind = LocatorKind::Selector;
    locator.value = selector;
    return locator;
}

Locator text_locator(const std::string &text) {
    Locator locator;
    locator.kind = LocatorKind::Text;
    locator.value = text;
    return locator;
}

LocatorResolution resolution_from_count(const Locator &locator, int match_count) {
    LocatorResolution resolution;
    resolution.success = true;
    if (match_count <= 0) {
        resolution.kind = ResolutionKind::NotFound;
        return resolution;
    }
    resolution.kind = (match_count == 1) ? ResolutionKind::SingleMatch : ResolutionKind::MultipleMatches;
    for (int index = 0; index < match_count; ++index) {
        ElementHandle handle;
        handle.locator = locator;
        handle.match_index = index;
        resolution.handles.push_back(handle);
    }
    return resolution;
}

} // namespace browser_driver
