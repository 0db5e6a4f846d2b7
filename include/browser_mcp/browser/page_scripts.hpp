#pragma once

namespace browser_mcp::page_scripts {

// Installs console, error and fetch/XHR hooks into window.__browserMcp.
// Idempotent; usable both as a document-start script and as a WebDriver
// function body.
extern const char* const kInstallHooks;

// WebDriver function bodies (executed with POST /execute/sync).
extern const char* const kDrainConsole;
extern const char* const kDrainResponses;
extern const char* const kPendingRequests;
extern const char* const kReadyState;
extern const char* const kVisibleText;
extern const char* const kEvaluate;        // arguments[0]: expression
extern const char* const kSelectOption;    // arguments[0]: element, [1]: value
extern const char* const kCleanHtml;       // arguments[0]: element|null, [1]: options

} // namespace browser_mcp::page_scripts
