#include "log.hpp"

#include "fmt/chrono.h"

#include <ctime>
#include <mutex>

namespace ve {
namespace Log {

namespace {
Display                  displayLevel = Display::None;
std::mutex               logMutex;
std::vector<std::string> savedEntries;

auto Stamp() -> std::string { return fmt::format("{:%H:%M:%S}", fmt::localtime(std::time(nullptr))); }
} // namespace

void SetDisplayLevel(Display const l)
{
  displayLevel = l;
  // Move the cursor one more line down so we don't erase whatever was printed before
  if (displayLevel == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto IsHigh() -> bool { return displayLevel == Display::High; }

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<8}] {}", Stamp(), category, fmt::vformat(fmt, args));
}

void SaveEntry(std::string const &s, fmt::text_style const style, Display const level)
{
  std::scoped_lock lock(logMutex);
  savedEntries.push_back(s);
  if (displayLevel >= level) {
    if (displayLevel == Display::Ephemeral) { fmt::print(stderr, "\033[A\33[2K\r"); }
    fmt::print(stderr, style, "{}\n", s);
  }
}

auto Saved() -> std::vector<std::string>
{
  std::scoped_lock lock(logMutex);
  return savedEntries;
}

void End()
{
  std::scoped_lock lock(logMutex);
  savedEntries.clear();
  displayLevel = Display::None;
}

auto Now() -> Time { return std::chrono::high_resolution_clock::now(); }

auto ToNow(Time const start) -> std::string
{
  auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - start).count();
  auto const mins = ms / 60000;
  auto const secs = (ms % 60000) / 1000;
  if (mins > 0) { return fmt::format("{}m {}s", mins, secs); }
  if (secs > 0) { return fmt::format("{}.{:03d}s", secs, ms % 1000); }
  return fmt::format("{}ms", ms);
}

} // namespace Log
} // namespace ve
