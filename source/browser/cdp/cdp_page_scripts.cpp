#include "browser/cdp/cdp_page_scripts.hpp"

#include <nlohmann/json.hpp>

namespace cdp_page_scripts {

using json = nlohmann::json;

const char *const NON_CONTENT_ANCESTORS = "head,script,style,noscript,template";

namespace {

std::string js_string_literal(const std::string &value) {
    return json(value).dump(-1, ' ', false, json::error_handler_t::replace);
}

// Wrap body so that `el` is the handle's element.
std::string with_element(const browser_driver::ElementHandle &element, const std::string &body) {
    return "(function(){"
           "var matches=" + locator_collection_expression(element.locator) + ";"
           "var el=matches[" + std::to_string(element.match_index) + "];"
           "if(!el){throw new Error('Element is not attached to the DOM');}" +
           body +
           "})()";
}

} // namespace

std::string locator_collection_expression(const browser_driver::Locator &locator) {
    if (locator.kind == browser_driver::LocatorKind::Selector) {
        return "Array.from(document.querySelectorAll(" + js_string_literal(locator.value) + "))";
    }
    return "(function(needle){"
           "var normalise=function(s){return (s||'').replace(/\\s+/g,' ').trim().toLowerCase();};"
           "var target=normalise(needle);"
           "var all=Array.from(document.querySelectorAll('*')).filter(function(el){"
           "return el!==document.documentElement&&"
           "!el.closest(" + js_string_literal(NON_CONTENT_ANCESTORS) + ")&&"
           "normalise(el.textContent).indexOf(target)!==-1;});"
           "var hasMatchedDescendant=new Set();"
           "all.forEach(function(el){var p=el.parentElement;"
           "while(p&&!hasMatchedDescendant.has(p)){hasMatchedDescendant.add(p);p=p.parentElement;}});"
           "return all.filter(function(el){return !hasMatchedDescendant.has(el);});"
           "})(" + js_string_literal(locator.value) + ")";
}

std::string count_matches_script(const browser_driver::Locator &locator) {
    return "(" + locator_collection_expression(locator) + ").length";
}

std::string element_geometry_script(const browser_driver::ElementHandle &element) {
    return with_element(element,
        "el.scrollIntoView({block:'center',inline:'center'});"
        "var r=el.getBoundingClientRect();"
        "if(r.width===0||r.height===0){throw new Error('Element is not visible');}"
        "return {x:r.left,y:r.top,width:r.width,height:r.height,"
        "scrollX:window.scrollX,scrollY:window.scrollY};");
}

std::string focus_editable_script(const browser_driver::ElementHandle &element) {
    return with_element(element,
        "var tag=el.tagName;"
        "var nonText=['button','checkbox','radio','file','submit','reset','image','color','range','hidden'];"
        "var editable=el.isContentEditable||tag==='TEXTAREA'||"
        "(tag==='INPUT'&&nonText.indexOf((el.type||'').toLowerCase())===-1);"
        "if(!editable){throw new Error('Element is not an <input>, <textarea> or [contenteditable] element');}"
        "if(el.disabled||el.readOnly){throw new Error('Element is not editable');}"
        "el.scrollIntoView({block:'center',inline:'center'});"
        "el.focus();"
        "return true;");
}

std::string select_option_script(const browser_driver::ElementHandle &element, const std::string &value) {
    return with_element(element,
        "if(el.tagName!=='SELECT'){throw new Error('Element is not a <select> element');}"
        "var wanted=" + js_string_literal(value) + ";"
        "var options=Array.from(el.options);"
        "var chosen=options.find(function(o){return o.value===wanted;})||"
        "options.find(function(o){return o.label===wanted||o.text.trim()===wanted;});"
        "if(!chosen){throw new Error('No option matches '+JSON.stringify(wanted));}"
        "el.value=chosen.value;"
        "chosen.selected=true;"
        "el.dispatchEvent(new Event('input',{bubbles:true}));"
        "el.dispatchEvent(new Event('change',{bubbles:true}));"
        "return chosen.value;");
}

std::string evaluate_with_console_capture_script(const std::string &script) {
    return "(function(script){"
           "var logs=[];"
           "var methods=['log','info','warn','error'];"
           "var original={};"
           "methods.forEach(function(method){"
           "original[method]=console[method];"
           "console[method]=function(){"
           "var args=Array.prototype.slice.call(arguments);"
           "logs.push('['+method+'] '+args.join(' '));"
           "return original[method].apply(console,args);};});"
           "var restore=function(){methods.forEach(function(method){console[method]=original[method];});};"
           "try{"
           "var result=(0,eval)(script);"
           "restore();"
           "return {hasResult:result!==undefined,result:result,logs:logs};"
           "}catch(error){restore();throw error;}"
           "})(" + js_string_literal(script) + ")";
}

} // namespace cdp_page_scripts
