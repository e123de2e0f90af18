#include "wraith_shim_script.h"

const char kShimScriptName[] = "shim.js";

namespace {

const char kShimScript[] = R"JS(
var system = require('system');
var webpage = require('webpage');
var webserver = require('webserver');

var port = system.args[system.args.length - 1];
var pages = {};       // ref -> page
var children = {};    // ref -> [child ref] in creation order
var headers = {};     // ref -> custom headers exactly as set
var nextRef = 1;

phantom.onError = function(msg) {
  console.error('wraith shim: ' + msg);
};

function register(page, parentRef) {
  var ref = 'page-' + (nextRef++);
  pages[ref] = page;
  children[ref] = [];
  page.onPageCreated = function(child) {
    var childRef = register(child, ref);
    if (page.ownsPages) {
      children[ref].push(childRef);
    }
  };
  page.onClosing = function() {
    forget(ref);
  };
  return ref;
}

function forget(ref) {
  delete pages[ref];
  delete headers[ref];
  for (var parent in children) {
    var list = children[parent];
    var i = list.indexOf(ref);
    if (i >= 0) list.splice(i, 1);
  }
}

function enterFrame(page, path) {
  page.switchToMainFrame();
  for (var i = 0; i < path.length; i++) {
    var step = path[i];
    var key = step.name !== undefined ? step.name : step.index;
    if (!page.switchToFrame(key)) {
      throw new Error('frame not found: ' + key);
    }
  }
}

// Path from the main frame to the focused frame. Unnamed frames are
// addressed by their position in the parent.
function focusedPath(page) {
  var token = 'wraith-focus-' + Date.now() + '-' + Math.random();
  page.switchToFocusedFrame();
  page.evaluate(function(t) { window.__wraithFocus = t; }, token);
  page.switchToMainFrame();
  var path = [];
  var found = findMarkedFrame(page, token, path);
  page.switchToMainFrame();
  return found ? path : [];
}

function findMarkedFrame(page, token, path) {
  var marked = page.evaluate(function(t) {
    if (window.__wraithFocus !== t) return false;
    delete window.__wraithFocus;
    return true;
  }, token);
  if (marked) return true;

  var names = page.framesName || [];
  var count = page.framesCount;
  for (var i = 0; i < count; i++) {
    if (!page.switchToFrame(i)) continue;
    path.push(names[i] ? {name: names[i]} : {index: i});
    if (findMarkedFrame(page, token, path)) return true;
    path.pop();
    page.switchToParentFrame();
  }
  return false;
}

function joinHeaders(h) {
  var out = {};
  for (var k in h) {
    out[k] = (h[k] instanceof Array) ? h[k].join(', ') : String(h[k]);
  }
  return out;
}

function keyCode(page, key) {
  if (typeof key === 'string' && key.length > 1 && page.event.key[key] !== undefined) {
    return page.event.key[key];
  }
  return key;
}

function prop(name) {
  return function(page) { return page[name]; };
}

function setter(name) {
  return function(page, args) { page[name] = args[0]; return null; };
}

// Members finishing synchronously return their result. Asynchronous members
// take a third argument and report through it.
var members = {
  canGoBack: prop('canGoBack'),
  canGoForward: prop('canGoForward'),
  clipRect: prop('clipRect'),
  setClipRect: setter('clipRect'),
  content: prop('content'),
  setContent: setter('content'),
  setContentAndUrl: function(page, args) { page.setContent(args[0], args[1]); return null; },
  cookies: prop('cookies'),
  setCookies: setter('cookies'),
  addCookie: function(page, args) { return page.addCookie(args[0]); },
  deleteCookie: function(page, args) { return page.deleteCookie(args[0]); },
  clearCookies: function(page) { page.clearCookies(); return null; },
  customHeaders: function(page, args, ref) { return headers[ref] || {}; },
  setCustomHeaders: function(page, args, ref) {
    headers[ref] = args[0];
    page.customHeaders = joinHeaders(args[0]);
    return null;
  },
  focusedFrameName: prop('focusedFrameName'),
  focusedFramePath: function(page) { return focusedPath(page); },
  frameContent: prop('frameContent'),
  setFrameContent: setter('frameContent'),
  frameName: prop('frameName'),
  framePlainText: prop('framePlainText'),
  frameTitle: prop('frameTitle'),
  frameUrl: prop('frameUrl'),
  framesCount: prop('framesCount'),
  framesName: prop('framesName'),
  hasFrame: function(page, args) {
    var step = args[0];
    return page.switchToFrame(step.name !== undefined ? step.name : step.index);
  },
  libraryPath: prop('libraryPath'),
  setLibraryPath: setter('libraryPath'),
  navigationLocked: prop('navigationLocked'),
  setNavigationLocked: setter('navigationLocked'),
  offlineStoragePath: prop('offlineStoragePath'),
  offlineStorageQuota: prop('offlineStorageQuota'),
  ownsPages: prop('ownsPages'),
  setOwnsPages: setter('ownsPages'),
  pages: function(page, args, ref) {
    return children[ref].map(function(childRef) {
      return {ref: childRef, windowName: pages[childRef].windowName || ''};
    });
  },
  paperSize: function(page) { return page.paperSize || {}; },
  setPaperSize: setter('paperSize'),
  plainText: prop('plainText'),
  scrollPosition: prop('scrollPosition'),
  setScrollPosition: setter('scrollPosition'),
  settings: function(page) {
    var s = page.settings;
    return {
      javascriptEnabled: s.javascriptEnabled,
      loadImages: s.loadImages,
      localToRemoteUrlAccessEnabled: s.localToRemoteUrlAccessEnabled,
      userAgent: s.userAgent || '',
      userName: s.userName || '',
      password: s.password || '',
      XSSAuditingEnabled: s.XSSAuditingEnabled,
      webSecurityEnabled: s.webSecurityEnabled,
      resourceTimeout: s.resourceTimeout || 0
    };
  },
  setSettings: function(page, args) {
    for (var k in args[0]) page.settings[k] = args[0][k];
    return null;
  },
  title: prop('title'),
  url: prop('url'),
  viewportSize: prop('viewportSize'),
  setViewportSize: setter('viewportSize'),
  windowName: prop('windowName'),
  zoomFactor: prop('zoomFactor'),
  setZoomFactor: setter('zoomFactor'),
  evaluateJavaScript: function(page, args) { return page.evaluateJavaScript(args[0]); },
  go: function(page, args) { return page.go(args[0]); },
  goBack: function(page) { page.goBack(); return null; },
  goForward: function(page) { page.goForward(); return null; },
  reload: function(page) { page.reload(); return null; },
  stop: function(page) { page.stop(); return null; },
  render: function(page, args) {
    if (!page.render(args[0], args[1])) throw new Error('cannot render to ' + args[0]);
    return null;
  },
  renderBase64: function(page, args) { return page.renderBase64(args[0]); },
  injectJs: function(page, args) { return page.injectJs(args[0]); },
  sendMouseEvent: function(page, args) {
    page.sendEvent(args[0], args[1], args[2], args[3]);
    return null;
  },
  sendKeyboardEvent: function(page, args) {
    page.sendEvent(args[0], keyCode(page, args[1]), null, null, args[2]);
    return null;
  },
  uploadFile: function(page, args) { page.uploadFile(args[0], args[1]); return null; },
  close: function(page, args, ref) {
    // Children outlive their parent
    page.ownsPages = false;
    forget(ref);
    page.close();
    return null;
  }
};

var asyncMembers = {
  open: function(page, args, ref, done) {
    page.open(args[0], function(status) {
      if (status === 'success') done(null, status);
      else done('failed to load ' + args[0]);
    });
  },
  includeJs: function(page, args, ref, done) {
    page.includeJs(args[0], function() { done(null, true); });
  }
};

function reply(response, body) {
  var text = JSON.stringify(body);
  var bytes = unescape(encodeURIComponent(text));
  response.statusCode = 200;
  response.headers = {
    'Content-Type': 'application/json',
    'Content-Length': bytes.length,
    'Connection': 'close'
  };
  response.setEncoding('binary');
  response.write(bytes);
  response.close();
}

function ok(response, result) {
  reply(response, {status: 'ok', result: result === undefined ? null : result});
}

function fail(response, message) {
  reply(response, {status: 'error', message: String(message)});
}

function invoke(request, response) {
  var ref = request.target;
  var page = pages[ref];
  if (!page) return fail(response, 'unknown page: ' + ref);

  var args = request.args || [];
  enterFrame(page, request.frame || []);

  if (members.hasOwnProperty(request.member)) {
    return ok(response, members[request.member](page, args, ref));
  }
  if (asyncMembers.hasOwnProperty(request.member)) {
    return asyncMembers[request.member](page, args, ref, function(err, result) {
      if (err) fail(response, err);
      else ok(response, result);
    });
  }
  fail(response, 'unknown member: ' + request.member);
}

var server = webserver.create();
var listening = server.listen('127.0.0.1:' + port, function(request, response) {
  try {
    var body = request.post ? JSON.parse(request.post) : {};
    if (request.url === '/ping') return ok(response, 'pong');
    if (request.url === '/create') return ok(response, register(webpage.create(), null));
    if (request.url === '/invoke') return invoke(body, response);
    fail(response, 'unknown endpoint: ' + request.url);
  } catch (e) {
    fail(response, e && e.message ? e.message : e);
  }
});

if (!listening) {
  console.error('wraith shim: cannot listen on port ' + port);
  phantom.exit(1);
}
)JS";

}  // namespace

const std::string& GetShimScript() {
  static const std::string script(kShimScript);
  return script;
}
