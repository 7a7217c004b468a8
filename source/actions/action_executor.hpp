#ifndef WEBMCPS_ACTION_EXECUTOR_HPP
#define WEBMCPS_ACTION_EXECUTOR_HPP

// Element actions with the first-match fallback policy, plus navigate,
// screenshot and evaluate. Every function returns an ActionResult; nothing
// here throws.
//
// Element actions: resolve the locator, act on the single match, or, when
// the locator is ambiguous, retry on the first match only. Messages always
// name the locator the caller gave, never a match index.

#include <string>

#include "browser/browser_driver_abi.hpp"
#include "capture/artifact_store.hpp"

namespace action_executor {

struct ActionResult {
    bool success = false;
    std::string message;   // caller-facing text (success or failure)
    std::string error_detail;
    bool used_first_match = false; // ambiguous locator, first match was used
    // Screenshot only: the captured image.
    std::string image_base64;
    std::string mime_type;
};

ActionResult navigate(browser_driver::Page &page, const std::string &url);

ActionResult click(browser_driver::Page &page, const browser_driver::Locator &locator);

// Type value into the element one character at a time.
ActionResult fill(browser_driver::Page &page, const browser_driver::Locator &locator,
                  const std::string &value, int per_character_delay_milliseconds);

ActionResult select_option(browser_driver::Page &page, const browser_driver::Locator &locator,
                           const std::string &value);

ActionResult hover(browser_driver::Page &page, const browser_driver::Locator &locator);

// Capture the element matched by selector (when non-empty) or the viewport /
// full page, and store it under name.
ActionResult screenshot(browser_driver::Page &page, capture::ArtifactStore &artifacts,
                        const std::string &name, const std::string &selector, bool full_page);

ActionResult evaluate(browser_driver::Page &page, const std::string &script);

// "<selector>" or "element with text <text>", as used in failure messages.
std::string describe_target(const browser_driver::Locator &locator);

} // namespace action_executor

#endif // WEBMCPS_ACTION_EXECUTOR_HPP
