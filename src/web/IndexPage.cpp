#include "web/Html.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vipervault::web {
namespace {

constexpr char kIndexHtml[] = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1.0">
  <title>@TITLE@</title>
  <style>
    :root {
      --bg-color: #ffffff; --text-color: #000000; --log-bg: #f8f8f8; --log-border: #ccc;
      --timer-color: #555; --heading-color: #0066cc; --select-bg: #fff; --select-border: #ccc;
    }
    body.dark {
      --bg-color: #0d1117; --text-color: #c9d1d9; --log-bg: #161b22; --log-border: #30363d;
      --timer-color: #8b949e; --heading-color: #58a6ff; --select-bg: #21262d; --select-border: #30363d;
    }
    html, body { height: 100%; margin: 0; padding: 0; overflow: hidden; }
    body {
      font-family: monospace; background-color: var(--bg-color); color: var(--text-color);
      transition: background-color 0.3s, color 0.3s;
    }
    #login-screen { display: none; align-items: center; justify-content: center; height: 100vh; flex-direction: column; gap: 20px; }
    #login-screen h1 { color: var(--heading-color); margin: 0; }
    #login-form { display: flex; flex-direction: column; gap: 12px; min-width: 300px; }
    #login-form input {
      padding: 10px; font-family: monospace; font-size: 1em; background: var(--select-bg);
      color: var(--text-color); border: 1px solid var(--select-border); border-radius: 6px;
    }
    #login-form button {
      padding: 10px; font-family: monospace; font-size: 1em; background: var(--heading-color);
      color: white; border: none; border-radius: 6px; cursor: pointer;
    }
    #login-error { color: #d73a49; display: none; text-align: center; }
    #content { display: none; flex-direction: column; height: 100vh; padding: 20px; padding-top: 60px; box-sizing: border-box; }
    #controls { margin-bottom: 12px; display: flex; flex-wrap: wrap; gap: 12px; align-items: center; }
    select, #log-search {
      padding: 8px 12px; font-family: monospace; background: var(--select-bg); color: var(--text-color);
      border: 1px solid var(--select-border); border-radius: 6px;
    }
    select { min-width: 260px; }
    #search-container { position: relative; flex-grow: 1; display: flex; align-items: center; min-width: 200px; }
    #log-search { width: 100%; padding-right: 60px; }
    #search-tools { position: absolute; right: 10px; display: flex; align-items: center; gap: 8px; user-select: none; font-size: 0.8em; }
    #clear-search { cursor: pointer; font-weight: bold; color: var(--timer-color); display: none; }
    .regex-badge { color: var(--heading-color); opacity: 0.6; font-size: 0.7em; border: 1px solid; padding: 1px 3px; border-radius: 3px; }
    #log-output {
      flex-grow: 1; white-space: pre-wrap; background-color: var(--log-bg); border: 1px solid var(--log-border);
      padding: 12px; overflow-y: auto; border-radius: 6px; margin-bottom: 12px;
    }
    #status-bar { display: flex; align-items: center; gap: 12px; font-size: 0.9em; color: var(--timer-color); }
    #pause-btn {
      padding: 4px 12px; cursor: pointer; border: 1px solid var(--log-border); border-radius: 4px;
      font-family: monospace; font-weight: bold; color: white; transition: background-color 0.2s;
    }
    .btn-running { background-color: #d73a49 !important; }
    .btn-paused { background-color: #28a745 !important; }
    #top-controls { position: fixed; top: 15px; right: 20px; display: flex; gap: 8px; z-index: 100; }
    @media (max-width: 768px) {
      #content { padding-top: 20px; }
      #top-controls { position: static; margin-bottom: 12px; justify-content: flex-end; }
    }
    #theme-toggle, #logout-btn, #info-btn {
      padding: 8px 12px; background: var(--log-bg); border: 1px solid var(--log-border);
      color: var(--text-color); cursor: pointer; border-radius: 4px; font-size: 1.2em;
    }
    h1 { color: var(--heading-color); margin: 0 0 8px 0; }
    #log-output::-webkit-scrollbar { width: 8px; }
    #log-output::-webkit-scrollbar-thumb { background: var(--log-border); border-radius: 4px; }
    #info-modal { display: none; position: fixed; z-index: 1000; left: 0; top: 0; width: 100%; height: 100%; background-color: rgba(0,0,0,0.5); }
    .modal-content {
      background-color: var(--select-bg); margin: 15% auto; padding: 20px; border: 1px solid var(--log-border);
      border-radius: 8px; width: 80%; max-width: 600px; color: var(--text-color);
    }
    .modal-header { display: flex; justify-content: space-between; align-items: center; border-bottom: 1px solid var(--log-border); padding-bottom: 10px; }
    .modal-body { padding: 20px 0; font-family: monospace; line-height: 1.6; }
    .modal-body div { margin-bottom: 10px; word-break: break-all; }
    .modal-body code { background: var(--log-bg); padding: 2px 4px; border: 1px solid var(--log-border); }
    .close-modal { cursor: pointer; font-size: 1.5em; }
  </style>
</head>
<body>
  <div id="login-screen">
    <h1>@TITLE@</h1>
    <form id="login-form">
      <input type="password" id="password-input" placeholder="Enter password" autocomplete="off">
      <button type="submit">Login</button>
      <div id="login-error">Invalid password. Please try again.</div>
    </form>
  </div>

  <div id="content">
    <div id="top-controls">
      <button id="info-btn" title="View Info">&#x2139;&#xFE0F;</button>
      <button id="theme-toggle" title="Toggle theme">&#x1F319;</button>
      <button id="logout-btn" title="Logout">&#x1F6AA;</button>
    </div>
    <h1 id="log-title">@TITLE@</h1>
    <div id="controls">
      <select id="log-selector">
        <option value="" disabled selected>Select log source...</option>
@OPTIONS@      </select>
      <div id="search-container">
        <input type="text" id="log-search" placeholder="Press '/' to search..." autocomplete="off">
        <div id="search-tools">
          <span class="regex-badge">REGEX</span>
          <span id="clear-search">X</span>
        </div>
      </div>
    </div>
    <div id="log-output">Select a log source to begin...</div>
    <div id="status-bar">
      <button id="pause-btn" class="btn-running">Pause</button>
      <span id="timer"></span>
    </div>
  </div>

  <div id="info-modal">
    <div class="modal-content">
      <div class="modal-header">
        <h3 style="margin:0;">View Configuration</h3>
        <span class="close-modal">&times;</span>
      </div>
      <div id="info-body" class="modal-body"></div>
    </div>
  </div>

  <script nonce="@NONCE@">
    const DEFAULT_INTERVAL = @DEFAULT_INTERVAL@;
    const LOG_CONFIG = @LOG_CONFIG@;
    const STORAGE_KEY = "lastSelectedLogView";

    let rawLogData = "";
    let countdown;
    let refreshTimeout;
    let currentView = null;
    let isPaused = false;
    let isAuthenticated = false;

    const loginScreen = document.getElementById('login-screen');
    const contentDiv = document.getElementById('content');
    const loginForm = document.getElementById('login-form');
    const passwordInput = document.getElementById('password-input');
    const loginError = document.getElementById('login-error');
    const logOutput = document.getElementById('log-output');
    const logTitle = document.getElementById('log-title');
    const selector = document.getElementById('log-selector');
    const timerEl = document.getElementById('timer');
    const pauseBtn = document.getElementById('pause-btn');
    const searchInput = document.getElementById('log-search');
    const clearSearchBtn = document.getElementById('clear-search');
    const logoutBtn = document.getElementById('logout-btn');
    const themeBtn = document.getElementById('theme-toggle');
    const infoBtn = document.getElementById('info-btn');
    const infoModal = document.getElementById('info-modal');
    const infoBody = document.getElementById('info-body');
    const closeModal = document.querySelector('.close-modal');

    function apiUrl(action, params) {
      const q = new URLSearchParams(Object.assign({ action: action }, params || {}));
      return '?' + q.toString();
    }

    function getInterval() {
      if (currentView && LOG_CONFIG[currentView] !== undefined) {
        return LOG_CONFIG[currentView].refresh;
      }
      return DEFAULT_INTERVAL;
    }

    function scrollIfBottom() {
      if (currentView && LOG_CONFIG[currentView] && LOG_CONFIG[currentView].bottom === true) {
        logOutput.scrollTop = logOutput.scrollHeight;
      }
    }

    function applyFilter() {
      const term = searchInput.value;
      clearSearchBtn.style.display = term ? 'block' : 'none';
      if (!term) {
        logOutput.textContent = rawLogData;
        scrollIfBottom();
        return;
      }
      const lines = rawLogData.split('\n');
      try {
        const regex = new RegExp(term, 'i');
        const filtered = lines.filter(line => regex.test(line)).join('\n');
        logOutput.textContent = filtered || "-- No regex matches found --";
      } catch (e) {
        const lowerTerm = term.toLowerCase();
        const filtered = lines.filter(line => line.toLowerCase().includes(lowerTerm)).join('\n');
        logOutput.textContent = filtered || "-- No matches found --";
      }
    }

    function startCountdown() {
      const interval = getInterval();
      if (isPaused || interval <= 0) return;
      let timeLeft = interval;
      clearInterval(countdown);
      countdown = setInterval(() => {
        if (isPaused) return;
        timeLeft--;
        timerEl.textContent = `Next refresh in ${timeLeft}s (Rate: ${getInterval()}s)`;
        if (timeLeft <= 0) {
          clearInterval(countdown);
          timerEl.textContent = "Refreshing...";
        }
      }, 1000);
    }

    function stopTimers() {
      clearTimeout(refreshTimeout);
      clearInterval(countdown);
    }

    function showLogin(message) {
      isAuthenticated = false;
      contentDiv.style.display = 'none';
      loginScreen.style.display = 'flex';
      if (message) {
        loginError.textContent = message;
        loginError.style.display = 'block';
      } else {
        loginError.style.display = 'none';
      }
      stopTimers();
      passwordInput.focus();
    }

    function showContent() {
      isAuthenticated = true;
      loginScreen.style.display = 'none';
      contentDiv.style.display = 'flex';
      loginError.style.display = 'none';
      initTheme();
      const saved = localStorage.getItem(STORAGE_KEY);
      if (saved && [...selector.options].some(o => o.value === saved)) {
        selector.value = saved;
        triggerSelection(saved);
      } else if (selector.options.length > 1) {
        const first = selector.options[1].value;
        selector.value = first;
        triggerSelection(first);
      }
    }

    async function loadLogs() {
      if (!currentView || !isAuthenticated) return;
      clearTimeout(refreshTimeout);
      if (isPaused) {
        refreshTimeout = setTimeout(loadLogs, 1000);
        return;
      }
      const requested = currentView;
      try {
        const resp = await fetch(apiUrl('get_log', { view: requested }), { credentials: 'same-origin', cache: 'no-store' });
        if (resp.status === 401) {
          showLogin("Session expired. Please login again.");
          return;
        }
        const data = await resp.text();
        if (requested !== currentView) return;
        rawLogData = data;
        applyFilter();
        scrollIfBottom();
        const interval = getInterval();
        if (interval > 0) {
          startCountdown();
          refreshTimeout = setTimeout(loadLogs, interval * 1000);
        } else {
          clearInterval(countdown);
          timerEl.textContent = "Auto-refresh disabled";
        }
      } catch (err) {
        console.error('fetch error:', err);
        timerEl.textContent = "Error fetching logs, retrying...";
        refreshTimeout = setTimeout(loadLogs, 5000);
      }
    }

    function infoRow(label, value, asCode) {
      const div = document.createElement('div');
      const strong = document.createElement('strong');
      strong.textContent = label + ': ';
      div.appendChild(strong);
      const span = document.createElement(asCode ? 'code' : 'span');
      span.textContent = value;
      div.appendChild(span);
      return div;
    }

    infoBtn.onclick = async () => {
      infoBody.replaceChildren();
      if (!currentView) {
        infoBody.textContent = "No log source selected.";
      } else {
        try {
          const resp = await fetch(apiUrl('view_info', { view: currentView }), { credentials: 'same-origin' });
          if (resp.status === 401) {
            showLogin("Session expired. Please login again.");
            return;
          }
          const cfg = await resp.json();
          infoBody.append(
            infoRow('Name', cfg.name),
            infoRow('Command', cfg.cmd, true),
            infoRow('Refresh Rate', cfg.refresh <= 0 ? "Disabled" : cfg.refresh + "s"),
            infoRow('Scroll to Bottom', cfg.bottom ? "Enabled" : "Disabled"),
            infoRow('HTML Escaping (Safe)', cfg.safe_output ? "Enabled" : "Disabled"));
        } catch (err) {
          infoBody.textContent = "Unable to load view information.";
        }
      }
      infoModal.style.display = "block";
    };

    closeModal.onclick = () => infoModal.style.display = "none";
    window.onclick = (e) => { if (e.target == infoModal) infoModal.style.display = "none"; };

    pauseBtn.addEventListener('click', () => {
      isPaused = !isPaused;
      pauseBtn.textContent = isPaused ? "Resume" : "Pause";
      if (isPaused) {
        pauseBtn.className = 'btn-paused';
        stopTimers();
        timerEl.textContent = "(Paused)";
      } else {
        pauseBtn.className = 'btn-running';
        loadLogs();
      }
    });

    function triggerSelection(viewName) {
      currentView = viewName;
      if (!currentView) return;
      const interval = getInterval();
      pauseBtn.style.display = interval > 0 ? "block" : "none";
      isPaused = false;
      pauseBtn.className = 'btn-running';
      pauseBtn.textContent = "Pause";
      logTitle.textContent = currentView;
      localStorage.setItem(STORAGE_KEY, currentView);
      rawLogData = "";
      logOutput.textContent = 'Loading...';
      stopTimers();
      timerEl.textContent = interval > 0
        ? "Loading... (Refresh rate: " + interval + "s)"
        : "Loading... (Auto-refresh disabled)";
      loadLogs();
    }

    searchInput.addEventListener('input', applyFilter);
    clearSearchBtn.addEventListener('click', () => {
      searchInput.value = "";
      applyFilter();
      searchInput.focus();
    });

    document.addEventListener('keydown', (e) => {
      const isModalVisible = infoModal.style.display === "block";
      if (e.key === "Escape") {
        if (isModalVisible) {
          infoModal.style.display = "none";
        } else if (document.activeElement === searchInput) {
          searchInput.value = "";
          applyFilter();
          searchInput.blur();
        }
      } else if (e.key === "/" &&
                 document.activeElement.tagName !== 'INPUT' &&
                 document.activeElement.tagName !== 'TEXTAREA' &&
                 !isModalVisible && isAuthenticated) {
        e.preventDefault();
        searchInput.focus();
      }
    });

    selector.addEventListener('change', function() { triggerSelection(this.value); });

    loginForm.addEventListener('submit', async (e) => {
      e.preventDefault();
      try {
        const resp = await fetch(apiUrl('login'), {
          method: 'POST',
          credentials: 'same-origin',
          headers: { 'Content-Type': 'application/x-www-form-urlencoded' },
          body: new URLSearchParams({ password: passwordInput.value }).toString()
        });
        const result = await resp.json();
        passwordInput.value = '';
        if (result.success) {
          showContent();
        } else {
          loginError.textContent = "Invalid password. Please try again.";
          loginError.style.display = 'block';
          passwordInput.focus();
        }
      } catch (err) {
        loginError.textContent = "Login error. Please try again.";
        loginError.style.display = 'block';
      }
    });

    logoutBtn.addEventListener('click', async () => {
      try {
        await fetch(apiUrl('logout'), { method: 'POST', credentials: 'same-origin' });
      } finally {
        currentView = null;
        showLogin(null);
      }
    });

    function setTheme(t) {
      if (t === 'dark') {
        document.body.classList.add('dark');
        themeBtn.textContent = '☀️';
      } else {
        document.body.classList.remove('dark');
        themeBtn.textContent = '\u{1F319}';
      }
      localStorage.setItem('theme', t);
    }

    function initTheme() {
      const savedTheme = localStorage.getItem('theme');
      if (savedTheme) {
        setTheme(savedTheme);
      } else if (window.matchMedia && window.matchMedia('(prefers-color-scheme: dark)').matches) {
        setTheme('dark');
      } else {
        setTheme('light');
      }
    }

    themeBtn.addEventListener('click', () => {
      setTheme(document.body.classList.contains('dark') ? 'light' : 'dark');
    });

    async function checkExistingSession() {
      try {
        const resp = await fetch(apiUrl('check_session'), { credentials: 'same-origin', cache: 'no-store' });
        const result = await resp.json();
        if (result.authenticated) showContent(); else showLogin(null);
      } catch (err) {
        showLogin(null);
      }
    }

    window.onload = () => {
      initTheme();
      checkExistingSession();
    };
  </script>
</body>
</html>
)HTML";

struct Slot {
  std::string_view name;
  std::string value;
};

// One pass over the template; substituted text is never rescanned.
std::string fill_template(std::string_view tpl, const std::vector<Slot>& slots) {
  std::string out;
  out.reserve(tpl.size() + 4096);
  size_t pos = 0;
  while (pos < tpl.size()) {
    size_t at = tpl.find('@', pos);
    if (at == std::string_view::npos) {
      out.append(tpl.substr(pos));
      break;
    }
    out.append(tpl.substr(pos, at - pos));
    size_t end = tpl.find('@', at + 1);
    const Slot* hit = nullptr;
    if (end != std::string_view::npos) {
      auto name = tpl.substr(at + 1, end - at - 1);
      for (const auto& sl : slots) {
        if (sl.name == name) { hit = &sl; break; }
      }
    }
    if (hit) {
      out += hit->value;
      pos = end + 1;
    } else {
      out += '@';
      pos = at + 1;
    }
  }
  return out;
}

} // namespace

auto render_index_page(const config::Config& cfg, std::string_view nonce) -> std::string {
  std::string options;
  for (const auto& v : cfg.views) {
    auto name = html_escape(v.name, true);
    options += "        <option value=\"" + name + "\">" + name + "</option>\n";
  }

  return fill_template(kIndexHtml, {
    {"OPTIONS", std::move(options)},
    {"DEFAULT_INTERVAL", std::to_string(cfg.refresh_interval)},
    {"LOG_CONFIG", json_for_script(client_view_config(cfg))},
    {"NONCE", std::string(nonce)},
    {"TITLE", html_escape(cfg.title, true)},
  });
}

} // namespace vipervault::web
