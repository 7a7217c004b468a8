#ifndef WEBMCPS_CDP_PAGE_SCRIPTS_HPP
#define WEBMCPS_CDP_PAGE_SCRIPTS_HPP

// JavaScript snippets evaluated in the page (Runtime.evaluate) by the CDP
// driver. Every builder returns a self-contained expression; string
// arguments are embedded as JSON literals.

#include <string>

#include "browser/browser_driver_abi.hpp"

namespace cdp_page_scripts {

extern const char *const NON_CONTENT_ANCESTORS;

// Expression evaluating to the array of elements matched by the locator, in
// document order. Text locators match the whitespace-normalised,
// case-insensitive text content and keep only the innermost matches.
// The root element and anything inside NON_CONTENT_ANCESTORS (the document
// head, scripts, templates) never match a text locator.
std::string locator_collection_expression(const browser_driver::Locator &locator);

// Number of elements matched by the locator.
std::string count_matches_script(const browser_driver::Locator &locator);

// Scroll the element into view and return its viewport rectangle plus the
// page scroll offsets: {x, y, width, height, scrollX, scrollY}.
// Throws in the page if the element is gone or has no size.
std::string element_geometry_script(const browser_driver::ElementHandle &element);

// Focus the element for typing. Throws if it is not an editable field.
std::string focus_editable_script(const browser_driver::ElementHandle &element);

// Choose the <option> whose value (first) or label/text (then) equals value,
// firing input and change. Throws if the element is not a <select> or no
// option matches.
std::string select_option_script(const browser_driver::ElementHandle &element, const std::string &value);

// Run script with console.log/info/warn/error wrapped; evaluates to
// {hasResult, result, logs}.
std::string evaluate_with_console_capture_script(const std::string &script);

} // namespace cdp_page_scripts

#endif // WEBMCPS_CDP_PAGE_SCRIPTS_HPP
