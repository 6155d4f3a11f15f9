#pragma once

// Injected at document start into the top frame. Gives the page:
//   window.__pandia.invoke(cmd, args) -> Promise
//   window.__pandia.listen(event, callback) -> unlisten function
// Events with no listener yet are held and delivered to the first one.
inline constexpr const char* PRELOAD_SCRIPT = R"JS(
(function () {
  if (window.__pandia) return;

  var pending = {};
  var nextId = 1;
  var listeners = {};
  var held = {};

  function deliver(event, payload) {
    var callbacks = listeners[event];
    if (!callbacks || callbacks.length === 0) {
      (held[event] = held[event] || []).push(payload);
      return;
    }
    callbacks.slice().forEach(function (callback) {
      try {
        callback(payload);
      } catch (e) {
        console.error('pandia: listener for ' + event + ' failed', e);
      }
    });
  }

  window.__pandia = {
    invoke: function (cmd, args) {
      return new Promise(function (resolve, reject) {
        var id = nextId++;
        pending[id] = { resolve: resolve, reject: reject };
        window.webkit.messageHandlers.pandia.postMessage(
          JSON.stringify({ id: id, cmd: cmd, args: args || {} }));
      });
    },

    listen: function (event, callback) {
      (listeners[event] = listeners[event] || []).push(callback);
      var queued = held[event];
      if (queued) {
        delete held[event];
        queued.forEach(function (payload) { deliver(event, payload); });
      }
      return function () {
        var list = listeners[event] || [];
        var index = list.indexOf(callback);
        if (index >= 0) list.splice(index, 1);
      };
    },

    __flush: function () {
      var queue = window.__pandiaQueue || [];
      window.__pandiaQueue = [];
      queue.forEach(function (entry) { deliver(entry[0], entry[1]); });
    },

    __resolve: function (response) {
      var request = pending[response.id];
      if (!request) return;
      delete pending[response.id];
      if (response.ok) {
        request.resolve(response.result);
      } else {
        request.reject(new Error(response.error));
      }
    }
  };

  window.__pandia.__flush();
})();
)JS";
