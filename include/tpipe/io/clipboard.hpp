/*
 * TPipe Clipboard Access
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Talks to the platform clipboard helper over a pipe: wl-paste/wl-copy
 *   when WAYLAND_DISPLAY is set, otherwise `xclip -selection clipboard`.
 *   TPIPE_CLIP_READ / TPIPE_CLIP_WRITE replace the helper with a command run
 *   through /bin/sh -c.
 */
#pragma once
#include <string>

namespace tpipe {

// Throws Error(ReadClipboard).
std::string read_clipboard();

// Throws Error(WriteToClipboard).
void write_clipboard(const std::string& text);

} // namespace tpipe
