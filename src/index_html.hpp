#pragma once

static const char kIndexHtml[] = R"HTML(
<!doctype html>
<html lang="en">
  <head>
    <meta charset="utf-8"/>
    <meta name="viewport" content="width=device-width,initial-scale=1,user-scalable=no"/>
    <title>Rover Control</title>
    <style>
      :root {
        --bg: #1f2a36;
        --card: #2c3e50;
        --muted: #95a5a6;
        --text: #ecf0f1;
        --accent: #1abc9c;
        --danger: #e74c3c;
        --border: #34495e;
      }
      * { box-sizing: border-box; }
      body {
        margin: 0;
        font-family: ui-sans-serif, system-ui, -apple-system, Segoe UI, sans-serif;
        background: var(--bg);
        color: var(--text);
        -webkit-user-select: none;
        user-select: none;
      }
      .wrap { max-width: 720px; margin: 20px auto; padding: 0 16px 32px; text-align: center; }
      h1 { margin: 0 0 16px; font-size: 26px; letter-spacing: 0.4px; }
      .video { background: #000; border: 2px solid var(--border); border-radius: 10px; overflow: hidden; }
      .video img { display: block; width: 100%; height: auto; min-height: 200px; }
      .pad {
        display: grid;
        grid-template-areas: ". up ." "left stop right" ". down .";
        grid-template-columns: repeat(3, 80px);
        grid-gap: 10px;
        justify-content: center;
        margin: 20px 0;
      }
      .pad button {
        height: 80px; font-size: 28px; border: 0; border-radius: 12px;
        background: var(--card); color: var(--text); cursor: pointer;
        touch-action: manipulation;
      }
      .pad button:active { background: var(--accent); }
      #btn-up { grid-area: up; } #btn-left { grid-area: left; }
      #btn-right { grid-area: right; } #btn-down { grid-area: down; }
      #btn-stop { grid-area: stop; background: var(--danger); }
      .status { background: var(--card); border-radius: 8px; padding: 10px 14px; text-align: left; font-size: 14px; }
      .status div { margin-bottom: 6px; }
      .light { display: inline-block; width: 10px; height: 10px; border-radius: 50%; margin-right: 8px; background: var(--muted); }
      .light.on { background: #2ecc71; }
      .light.off { background: var(--danger); }
      .urls { font-size: 12px; margin-top: 10px; padding: 8px; border: 1px solid var(--accent); border-radius: 6px; word-break: break-all; }
      .urls a { color: var(--accent); text-decoration: none; }
    </style>
  </head>
  <body>
    <div class="wrap">
      <h1>Rover Control</h1>
      <div class="video">
        <img id="video" src="/video_feed" alt="Video stream loading..."/>
      </div>
      <div class="pad">
        <button id="btn-up">&#9650;</button>
        <button id="btn-left">&#9664;</button>
        <button id="btn-stop">&#9632;</button>
        <button id="btn-right">&#9654;</button>
        <button id="btn-down">&#9660;</button>
      </div>
      <div class="status">
        <div id="message">Status: initializing...</div>
        <div><span id="cam-light" class="light"></span>Camera: <span id="cam-status">unknown</span></div>
        <div><span id="motor-light" class="light"></span>Motor controller: <span id="motor-status">unknown</span></div>
        <div><span>Viewers: </span><span id="viewers">-</span></div>
        <div class="urls" id="urls">Access URLs will appear here.</div>
      </div>
    </div>

    <script>
      const REPEAT_MS = 150;
      const $ = (id) => document.getElementById(id);
      const video = $('video');
      const message = $('message');
      let repeatTimer = null;
      let activeKey = null;

      function send(direction) {
        fetch('/api/control/' + direction, { method: 'POST' })
          .then((r) => r.json())
          .then((data) => {
            message.textContent = data.status === 'success'
              ? 'Last: ' + direction.toUpperCase() + ' OK'
              : 'Error: ' + data.message;
          })
          .catch(() => { message.textContent = 'Control request failed'; });
      }

      function release() {
        if (repeatTimer) {
          clearInterval(repeatTimer);
          repeatTimer = null;
        }
        send('stop');
      }

      function press(direction) {
        if (repeatTimer) {
          clearInterval(repeatTimer);
          repeatTimer = null;
        }
        send(direction);
        if (direction !== 'stop') {
          repeatTimer = setInterval(() => send(direction), REPEAT_MS);
        }
      }

      [['btn-up', 'up'], ['btn-down', 'down'], ['btn-left', 'left'],
       ['btn-right', 'right'], ['btn-stop', 'stop']].forEach(([id, dir]) => {
        const btn = $(id);
        const up = (e) => { if (e) e.preventDefault(); if (dir !== 'stop') release(); };
        btn.addEventListener('mousedown', () => press(dir));
        btn.addEventListener('mouseup', () => up());
        btn.addEventListener('mouseleave', () => { if (repeatTimer && dir !== 'stop') release(); });
        btn.addEventListener('touchstart', (e) => { e.preventDefault(); press(dir); }, { passive: false });
        btn.addEventListener('touchend', up);
        btn.addEventListener('touchcancel', up);
      });

      const keys = {
        ArrowUp: 'up', w: 'up', ArrowDown: 'down', s: 'down',
        ArrowLeft: 'left', a: 'left', ArrowRight: 'right', d: 'right',
        ' ': 'stop', Escape: 'stop'
      };
      document.addEventListener('keydown', (e) => {
        const dir = keys[e.key];
        if (!dir || e.repeat) return;
        e.preventDefault();
        if (activeKey !== dir) {
          press(dir);
          activeKey = dir;
        }
      });
      document.addEventListener('keyup', (e) => {
        const dir = keys[e.key];
        if (!dir) return;
        e.preventDefault();
        if (dir === 'stop') send('stop'); else release();
        activeKey = null;
      });

      function setLight(id, on) { $(id).className = 'light ' + (on ? 'on' : 'off'); }

      function refreshStatus() {
        fetch('/api/status')
          .then((r) => r.json())
          .then((s) => {
            let cam = 'offline';
            if (!s.camera_available) cam = 'not available';
            else if (s.camera_running) cam = 'running (' + s.camera_resolution[0] + 'x' +
              s.camera_resolution[1] + ' @ ' + s.camera_target_fps + ' FPS)';
            else if (s.camera_fault) cam = 'offline: ' + s.camera_fault;
            $('cam-status').textContent = cam;
            setLight('cam-light', s.camera_running);
            $('motor-status').textContent = s.motor_controller_status + ' (' + s.motor_controller_target + ')';
            setLight('motor-light', s.motor_controller_status === 'Connected');
            $('viewers').textContent = s.active_streams;
            const local = 'http://' + s.local_ip + ':' + s.web_port;
            let html = '<strong>Local:</strong> <a href="' + local + '" target="_blank">' + local + '</a>';
            if (s.tunnel_url) {
              html += '<br><strong>Public:</strong> <a href="' + s.tunnel_url + '" target="_blank">' + s.tunnel_url + '</a>';
            }
            $('urls').innerHTML = html;
            if (s.camera_running && (!video.complete || video.naturalWidth === 0)) {
              video.src = '/video_feed?' + Date.now();
            }
          })
          .catch(() => {
            message.textContent = 'Status update failed';
            setLight('cam-light', false);
            setLight('motor-light', false);
          });
      }

      video.onerror = () => {
        video.alt = 'Video stream error, retrying...';
        setTimeout(() => { video.src = '/video_feed?' + Date.now(); }, 3000);
      };

      refreshStatus();
      setInterval(refreshStatus, 5000);
    </script>
  </body>
</html>
)HTML";
