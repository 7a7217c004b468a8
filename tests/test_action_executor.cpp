// Tests for element actions (first-match fallback), screenshots and evaluate.

#include "actions/action_executor.hpp"
#include "fake_browser.hpp"

#include <iostream>
#include <string>

namespace test_action_executor {

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static bool test_click_ambiguous_uses_first_match() {
    fake_browser::FakeWorld world;
    world.match_counts[".btn"] = 3;
    fake_browser::FakePage page(world);

    action_executor::ActionResult result = action_executor::click(page, browser_driver::selector_locator(".btn"));
    return expect(result.success && result.used_first_match && result.message == "Clicked: .btn" &&
                      world.action_log.size() == 1 && world.action_log[0] == "click .btn#0" &&
                      result.message.find("#0") == std::string::npos,
                  "Clicking a selector with 3 matches clicks the first and names the selector");
}

static bool test_click_single_match() {
    fake_browser::FakeWorld world;
    world.match_counts["#submit"] = 1;
    fake_browser::FakePage page(world);

    action_executor::ActionResult result =
        action_executor::click(page, browser_driver::selector_locator("#submit"));
    return expect(result.success && !result.used_first_match && result.message == "Clicked: #submit",
                  "Clicking a unique selector");
}

static bool test_click_not_found() {
    fake_browser::FakeWorld world;
    fake_browser::FakePage page(world);

    action_executor::ActionResult result =
        action_executor::click(page, browser_driver::selector_locator("#missing"));
    return expect(!result.success &&
                      result.message == "Failed to click #missing: no element matches selector '#missing'" &&
                      world.action_log.empty(),
                  "A selector without matches fails without acting");
}

static bool test_click_text_messages() {
    fake_browser::FakeWorld world;
    world.match_counts["Sign in"] = 2;
    fake_browser::FakePage page(world);

    action_executor::ActionResult found = action_executor::click(page, browser_driver::text_locator("Sign in"));
    action_executor::ActionResult missing = action_executor::click(page, browser_driver::text_locator("Log out"));
    return expect(found.success && found.message == "Clicked element with text: Sign in" &&
                      !missing.success &&
                      missing.message ==
                          "Failed to click element with text Log out: no element matches text 'Log out'",
                  "Text locators are described by their text");
}

static bool test_action_failure_messages() {
    fake_browser::FakeWorld world;
    world.match_counts["#only"] = 1;
    world.match_counts[".many"] = 4;
    world.failing_actions.insert("hover");
    fake_browser::FakePage page(world);

    action_executor::ActionResult single = action_executor::hover(page, browser_driver::selector_locator("#only"));
    action_executor::ActionResult retried = action_executor::hover(page, browser_driver::selector_locator(".many"));
    return expect(!single.success && single.message == "Failed to hover #only: element is not visible" &&
                      !retried.success &&
                      retried.message == "Failed (twice) to hover .many: element is not visible",
                  "Failures are reported once for a unique match and as retried for an ambiguous one");
}

static bool test_resolution_error() {
    fake_browser::FakeWorld world;
    world.resolve_fails = true;
    fake_browser::FakePage page(world);

    action_executor::ActionResult result = action_executor::click(page, browser_driver::selector_locator("a[["));
    return expect(!result.success && result.message.find("Failed to click a[[: ") == 0,
                  "An invalid selector is a failure result");
}

static bool test_fill_types_with_delay() {
    fake_browser::FakeWorld world;
    world.match_counts["input[name=q]"] = 1;
    fake_browser::FakePage page(world);

    action_executor::ActionResult result =
        action_executor::fill(page, browser_driver::selector_locator("input[name=q]"), "hello", 25);
    return expect(result.success && result.message == "Filled input[name=q] with: hello" &&
                      world.last_typing_delay == 25 && world.action_log[0] == "type input[name=q]#0 hello",
                  "fill types the value with the configured per-character delay");
}

static bool test_select_messages() {
    fake_browser::FakeWorld world;
    world.match_counts["#country"] = 1;
    world.match_counts["Country"] = 1;
    fake_browser::FakePage page(world);

    action_executor::ActionResult by_selector =
        action_executor::select_option(page, browser_driver::selector_locator("#country"), "de");
    action_executor::ActionResult by_text =
        action_executor::select_option(page, browser_driver::text_locator("Country"), "fr");
    return expect(by_selector.message == "Selected #country with: de" &&
                      by_text.message == "Selected element with text Country with value: fr",
                  "select reports the chosen value");
}

static bool test_navigate_results() {
    fake_browser::FakeWorld world;
    fake_browser::FakePage page(world);

    action_executor::ActionResult ok = action_executor::navigate(page, "https://example.com");
    world.navigate_fails = true;
    action_executor::ActionResult failed = action_executor::navigate(page, "https://nowhere.invalid");
    return expect(ok.success && ok.message == "Navigated to https://example.com" && !failed.success &&
                      failed.message == "Failed to navigate to https://nowhere.invalid: net::ERR_NAME_NOT_RESOLVED",
                  "navigate reports success and engine errors");
}

static bool test_screenshot_is_stored() {
    fake_browser::FakeWorld world;
    fake_browser::FakePage page(world);
    capture::ArtifactStore artifacts;
    int list_changes = 0;
    artifacts.set_list_changed_callback([&list_changes]() { list_changes++; });

    action_executor::ActionResult result = action_executor::screenshot(page, artifacts, "home", "", true);
    std::optional<capture::ScreenshotArtifact> stored = artifacts.get("home");
    return expect(result.success && result.message == "Screenshot 'home' taken" &&
                      result.mime_type == "image/png" && world.last_screenshot_full_page &&
                      stored.has_value() && stored->image_base64 == world.screenshot_data && list_changes == 1,
                  "A screenshot is stored under its name and announced");
}

static bool test_screenshot_overwrites() {
    fake_browser::FakeWorld world;
    fake_browser::FakePage page(world);
    capture::ArtifactStore artifacts;

    action_executor::screenshot(page, artifacts, "shot", "", false);
    world.screenshot_data = "c2Vjb25k";
    action_executor::screenshot(page, artifacts, "shot", "", false);
    return expect(artifacts.size() == 1 && artifacts.get("shot")->image_base64 == "c2Vjb25k",
                  "A screenshot with an existing name replaces it");
}

static bool test_element_screenshot() {
    fake_browser::FakeWorld world;
    world.match_counts[".card"] = 2;
    fake_browser::FakePage page(world);
    capture::ArtifactStore artifacts;

    action_executor::ActionResult found = action_executor::screenshot(page, artifacts, "card", ".card", false);
    action_executor::ActionResult missing = action_executor::screenshot(page, artifacts, "none", "#nope", false);
    return expect(found.success && found.used_first_match && world.element_screenshot_count == 1 &&
                      world.action_log[0] == "screenshot .card#0" && !missing.success &&
                      missing.message == "Element not found: #nope" && !artifacts.get("none").has_value(),
                  "Element screenshots use the first match; a missing element is reported");
}

static bool test_empty_capture_fails() {
    fake_browser::FakeWorld world;
    world.screenshot_data = "";
    fake_browser::FakePage page(world);
    capture::ArtifactStore artifacts;

    action_executor::ActionResult result = action_executor::screenshot(page, artifacts, "blank", "", false);
    return expect(!result.success && result.message == "Screenshot failed" && artifacts.size() == 0,
                  "An empty capture is a failure and nothing is stored");
}

static bool test_evaluate_formatting() {
    fake_browser::FakeWorld world;
    world.evaluate_result.success = true;
    world.evaluate_result.result_value = nlohmann::json{{"answer", 42}};
    world.evaluate_result.console_lines = {"[log] hello world", "[warn] careful"};
    fake_browser::FakePage page(world);

    action_executor::ActionResult result = action_executor::evaluate(page, "({answer: 42})");
    std::string expected = "Execution result:\n{\n  \"answer\": 42\n}\n\nConsole output:\n"
                           "[log] hello world\n[warn] careful";
    return expect(result.success && result.message == expected && world.last_script == "({answer: 42})",
                  "evaluate prints the result as JSON followed by console output");
}

static bool test_evaluate_undefined_and_error() {
    fake_browser::FakeWorld world;
    world.evaluate_result.success = true;
    world.evaluate_result.result_is_undefined = true;
    fake_browser::FakePage page(world);

    action_executor::ActionResult undefined_result = action_executor::evaluate(page, "void 0");

    world.evaluate_result = browser_driver::EvaluateResult();
    world.evaluate_result.success = false;
    world.evaluate_result.error_detail = "boom";
    action_executor::ActionResult error_result = action_executor::evaluate(page, "throw new Error('boom')");

    return expect(undefined_result.success &&
                      undefined_result.message == "Execution result:\nundefined\n\nConsole output:\n" &&
                      !error_result.success && error_result.message == "Script execution failed: boom",
                  "evaluate prints undefined and reports script errors");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_click_ambiguous_uses_first_match();
    all_passed &= test_click_single_match();
    all_passed &= test_click_not_found();
    all_passed &= test_click_text_messages();
    all_passed &= test_action_failure_messages();
    all_passed &= test_resolution_error();
    all_passed &= test_fill_types_with_delay();
    all_passed &= test_select_messages();
    all_passed &= test_navigate_results();
    all_passed &= test_screenshot_is_stored();
    all_passed &= test_screenshot_overwrites();
    all_passed &= test_element_screenshot();
    all_passed &= test_empty_capture_fails();
    all_passed &= test_evaluate_formatting();
    all_passed &= test_evaluate_undefined_and_error();
    return all_passed;
}

} // namespace test_action_executor
