#pragma once

#include <string>

namespace rdash::cli {

// Runs xdg-open (open on macOS) on the URL. Returns false when the
// launcher could not be started or exited with an error.
bool OpenInBrowser(const std::string& url);

} // namespace rdash::cli
