#include "actions/action_executor.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <functional>

namespace action_executor {

using browser_driver::DriverResult;
using browser_driver::ElementHandle;
using browser_driver::Locator;
using browser_driver::LocatorKind;
using browser_driver::LocatorResolution;
using browser_driver::ResolutionKind;

std::string describe_target(const Locator &locator) {
    if (locator.kind == LocatorKind::Text) {
        return "element with text " + locator.value;
    }
    return locator.value;
}

namespace {

using ElementAction = std::function<DriverResult(const ElementHandle &)>;

std::string describe_no_match(const Locator &locator) {
    if (locator.kind == LocatorKind::Text) {
        return "no element matches text '" + locator.value + "'";
    }
    return "no element matches selector '" + locator.value + "'";
}

ActionResult failure(const std::string &message, const std::string &detail) {
    ActionResult result;
    result.success = false;
    result.message = message;
    result.error_detail = detail;
    return result;
}

// Invoke a driver call, turning an escaping exception into a failed DriverResult.
DriverResult guarded(const ElementAction &action, const ElementHandle &element) {
    try {
        return action(element);
    } catch (const std::exception &error) {
        DriverResult result;
        result.success = false;
        result.error_detail = error.what();
        return result;
    }
}

LocatorResolution guarded_resolve(browser_driver::Page &page, const Locator &locator) {
    try {
        return page.resolve(locator);
    } catch (const std::exception &error) {
        LocatorResolution resolution;
        resolution.success = false;
        resolution.error_detail = error.what();
        return resolution;
    }
}

// Resolve, act, and fall back to the first match when the locator is ambiguous.
ActionResult run_element_action(browser_driver::Page &page, const Locator &locator, const std::string &verb,
                                const std::string &success_message, const ElementAction &action) {
    std::string target = describe_target(locator);

    LocatorResolution resolution = guarded_resolve(page, locator);
    if (!resolution.success) {
        return failure("Failed to " + verb + " " + target + ": " + resolution.error_detail,
                       resolution.error_detail);
    }

    switch (resolution.kind) {
    case ResolutionKind::NotFound: {
        std::string cause = describe_no_match(locator);
        return failure("Failed to " + verb + " " + target + ": " + cause, cause);
    }

    case ResolutionKind::SingleMatch: {
        DriverResult attempt = guarded(action, resolution.handles.front());
        if (!attempt.success) {
            return failure("Failed to " + verb + " " + target + ": " + attempt.error_detail, attempt.error_detail);
        }
        ActionResult result;
        result.success = true;
        result.message = success_message;
        return result;
    }

    case ResolutionKind::MultipleMatches: {
        debug_log::log("Strict mode violation: " + std::to_string(resolution.handles.size()) +
                       " elements match " + target + ", retrying on first element...");
        DriverResult retry = guarded(action, resolution.handles.front());
        if (!retry.success) {
            return failure("Failed (twice) to " + verb + " " + target + ": " + retry.error_detail, retry.error_detail);
        }
        ActionResult result;
        result.success = true;
        result.message = success_message;
        result.used_first_match = true;
        return result;
    }
    }

    return failure("Failed to " + verb + " " + target + ": unexpected resolution", "unexpected resolution");
}

} // namespace

ActionResult navigate(browser_driver::Page &page, const std::string &url) {
    browser_driver::NavigateResult navigate_result;
    try {
        navigate_result = page.navigate(url);
    } catch (const std::exception &error) {
        navigate_result.success = false;
        navigate_result.error_text = error.what();
    }
    if (!navigate_result.success) {
        return failure("Failed to navigate to " + url + ": " + navigate_result.error_text, navigate_result.error_text);
    }
    ActionResult result;
    result.success = true;
    result.message = "Navigated to " + url;
    return result;
}

ActionResult click(browser_driver::Page &page, const Locator &locator) {
    std::string message = (locator.kind == LocatorKind::Text)
        ? "Clicked element with text: " + locator.value
        : "Clicked: " + locator.value;
    return run_element_action(page, locator, "click", message,
                              [&page](const ElementHandle &element) { return page.click(element); });
}

ActionResult fill(browser_driver::Page &page, const Locator &locator, const std::string &value,
                  int per_character_delay_milliseconds) {
    std::string message = "Filled " + describe_target(locator) + " with: " + value;
    return run_element_action(page, locator, "fill", message,
                              [&page, &value, per_character_delay_milliseconds](const ElementHandle &element) {
                                  return page.type_text(element, value, per_character_delay_milliseconds);
                              });
}

ActionResult select_option(browser_driver::Page &page, const Locator &locator, const std::string &value) {
    std::string message = (locator.kind == LocatorKind::Text)
        ? "Selected element with text " + locator.value + " with value: " + value
        : "Selected " + locator.value + " with: " + value;
    return run_element_action(page, locator, "select", message,
                              [&page, &value](const ElementHandle &element) {
                                  return page.select_option(element, value);
                              });
}

ActionResult hover(browser_driver::Page &page, const Locator &locator) {
    std::string message = (locator.kind == LocatorKind::Text)
        ? "Hovered element with text: " + locator.value
        : "Hovered " + locator.value;
    return run_element_action(page, locator, "hover", message,
                              [&page](const ElementHandle &element) { return page.hover(element); });
}

ActionResult screenshot(browser_driver::Page &page, capture::ArtifactStore &artifacts,
                        const std::string &name, const std::string &selector, bool full_page) {
    browser_driver::CaptureScreenshotResult capture_result;
    bool used_first_match = false;

    try {
        if (!selector.empty()) {
            Locator locator = browser_driver::selector_locator(selector);
            LocatorResolution resolution = page.resolve(locator);
            if (!resolution.success) {
                return failure("Screenshot failed: " + resolution.error_detail, resolution.error_detail);
            }
            if (resolution.kind == ResolutionKind::NotFound) {
                return failure("Element not found: " + selector, describe_no_match(locator));
            }
            used_first_match = (resolution.kind == ResolutionKind::MultipleMatches);
            capture_result = page.capture_element_screenshot(resolution.handles.front());
        } else {
            capture_result = page.capture_screenshot(full_page);
        }
    } catch (const std::exception &error) {
        return failure("Screenshot failed: " + std::string(error.what()), error.what());
    }

    if (!capture_result.success) {
        return failure("Screenshot failed: " + capture_result.error_detail, capture_result.error_detail);
    }
    if (capture_result.image_base64.empty()) {
        std::string message = selector.empty() ? "Screenshot failed" : "Element not found: " + selector;
        return failure(message, "empty capture");
    }

    capture::ScreenshotArtifact artifact;
    artifact.mime_type = capture_result.mime_type.empty() ? "image/png" : capture_result.mime_type;
    artifact.image_base64 = capture_result.image_base64;
    artifacts.put(name, artifact);

    ActionResult result;
    result.success = true;
    result.message = "Screenshot '" + name + "' taken";
    result.used_first_match = used_first_match;
    result.image_base64 = artifact.image_base64;
    result.mime_type = artifact.mime_type;
    return result;
}

ActionResult evaluate(browser_driver::Page &page, const std::string &script) {
    browser_driver::EvaluateResult evaluate_result;
    try {
        evaluate_result = page.evaluate(script);
    } catch (const std::exception &error) {
        evaluate_result.success = false;
        evaluate_result.error_detail = error.what();
    }
    if (!evaluate_result.success) {
        return failure("Script execution failed: " + evaluate_result.error_detail, evaluate_result.error_detail);
    }

    std::string rendered_value = evaluate_result.result_is_undefined
        ? "undefined"
        : evaluate_result.result_value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    std::string console_output;
    for (size_t index = 0; index < evaluate_result.console_lines.size(); ++index) {
        if (index > 0) {
            console_output += "\n";
        }
        console_output += evaluate_result.console_lines[index];
    }

    ActionResult result;
    result.success = true;
    result.message = "Execution result:\n" + rendered_value + "\n\nConsole output:\n" + console_output;
    return result;
}

} // namespace action_executor
