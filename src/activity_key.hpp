#pragma once

#include <functional>
#include <string>

#include "common.hpp"

// Category label that keeps an activity out of every total.
#define UNKNOWN_CATEGORY "Unknown"

// Derives the name an interval is categorized under.
using ActivityKey = std::function<std::string(const ActivityInterval &)>;

std::string AppNameKey(const ActivityInterval &interval);

// Browsers are keyed by site and editors by file:
//   google-chrome, "https://github.com/x - Google Chrome"  -> "github.com"
//   google-chrome, "Inbox - Gmail - Google Chrome"         -> "Chrome - Gmail"
//   code, "main.cpp - repo - Visual Studio Code"           -> "VSCode - main.cpp"
// Everything else, and any window without a title, is keyed by app name.
std::string TitleActivityKey(const ActivityInterval &interval);

// Host part of the first http(s) URL in text, empty when there is none.
std::string UrlHost(const std::string &text);
