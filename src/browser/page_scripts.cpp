#include <browser_mcp/browser/page_scripts.hpp>

namespace browser_mcp::page_scripts {

const char* const kInstallHooks = R"JS(
if (!window.__browserMcp) {
  const state = { console: [], responses: [], pending: 0 };
  const format = (value) => {
    if (typeof value === 'string') return value;
    if (value instanceof Error) return value.stack || value.message;
    try { return JSON.stringify(value); } catch (e) { return String(value); }
  };
  const push = (list, entry, limit) => {
    list.push(entry);
    if (list.length > limit) list.shift();
  };
  ['log', 'info', 'warn', 'error', 'debug'].forEach((level) => {
    const original = console[level];
    console[level] = function (...args) {
      push(state.console, {
        type: level === 'warn' ? 'warning' : level,
        text: args.map(format).join(' ')
      }, 1000);
      return original.apply(this, args);
    };
  });
  window.addEventListener('error', (event) => {
    push(state.console, { type: 'exception', text: event.message || format(event.error) }, 1000);
  });
  window.addEventListener('unhandledrejection', (event) => {
    push(state.console, {
      type: 'exception',
      text: '[Unhandled Promise Rejection] ' + format(event.reason)
    }, 1000);
  });
  const record = (url, status, body) => {
    push(state.responses, { url: String(url), status: status, body: String(body) }, 200);
  };
  if (window.fetch) {
    const originalFetch = window.fetch;
    window.fetch = function (...args) {
      state.pending++;
      return originalFetch.apply(this, args).then((response) => {
        state.pending--;
        response.clone().text().then(
          (body) => record(response.url, response.status, body),
          () => record(response.url, response.status, ''));
        return response;
      }, (error) => {
        state.pending--;
        throw error;
      });
    };
  }
  const open = XMLHttpRequest.prototype.open;
  const send = XMLHttpRequest.prototype.send;
  XMLHttpRequest.prototype.open = function (method, url, ...rest) {
    this.__browserMcpUrl = url;
    return open.call(this, method, url, ...rest);
  };
  XMLHttpRequest.prototype.send = function (...args) {
    state.pending++;
    this.addEventListener('loadend', () => {
      state.pending--;
      let body = '';
      try {
        if (this.responseType === '' || this.responseType === 'text') body = this.responseText;
      } catch (e) {}
      record(this.responseURL || this.__browserMcpUrl, this.status, body);
    });
    return send.apply(this, args);
  };
  window.__browserMcp = state;
}
)JS";

const char* const kDrainConsole = R"JS(
const state = window.__browserMcp;
if (!state) return [];
const entries = state.console;
state.console = [];
return entries;
)JS";

const char* const kDrainResponses = R"JS(
const state = window.__browserMcp;
if (!state) return [];
const entries = state.responses;
state.responses = [];
return entries;
)JS";

const char* const kPendingRequests = R"JS(
return window.__browserMcp ? window.__browserMcp.pending : 0;
)JS";

const char* const kReadyState = R"JS(
return document.readyState;
)JS";

const char* const kVisibleText = R"JS(
return document.body ? document.body.innerText : '';
)JS";

const char* const kEvaluate = R"JS(
return (0, eval)(arguments[0]);
)JS";

const char* const kSelectOption = R"JS(
const element = arguments[0];
const value = arguments[1];
if (!(element instanceof HTMLSelectElement)) {
  throw new Error('Element is not a <select> element');
}
const option = Array.from(element.options).find(
  (o) => o.value === value || o.label === value || o.text === value);
if (!option) {
  throw new Error('No option matching "' + value + '"');
}
element.value = option.value;
option.selected = true;
element.dispatchEvent(new Event('input', { bubbles: true }));
element.dispatchEvent(new Event('change', { bubbles: true }));
)JS";

const char* const kCleanHtml = R"JS(
const root = arguments[0] || document.documentElement;
const options = arguments[1];
const clone = root.cloneNode(true);
const removeAll = (selector) => clone.querySelectorAll(selector).forEach((n) => n.remove());
if (options.removeScripts) removeAll('script');
if (options.removeStyles) {
  removeAll('style');
  removeAll('link[rel="stylesheet"]');
  clone.querySelectorAll('[style]').forEach((n) => n.removeAttribute('style'));
}
if (options.removeMeta) removeAll('meta');
if (options.cleanHtml) {
  removeAll('noscript');
  removeAll('template');
  clone.querySelectorAll('*').forEach((n) => {
    for (const attr of Array.from(n.attributes)) {
      if (attr.name.startsWith('on') || attr.name.startsWith('data-')) n.removeAttribute(attr.name);
    }
  });
}
if (options.removeComments || options.cleanHtml) {
  const walker = document.createTreeWalker(clone, NodeFilter.SHOW_COMMENT);
  const comments = [];
  while (walker.nextNode()) comments.push(walker.currentNode);
  comments.forEach((c) => c.remove());
}
let html = clone.outerHTML;
if (options.minify) {
  html = html.replace(/>\s+</g, '><').replace(/\s{2,}/g, ' ').trim();
}
return html;
)JS";

} // namespace browser_mcp::page_scripts
