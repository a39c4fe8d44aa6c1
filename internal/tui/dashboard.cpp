#include "dashboard.hpp"

#include <ncurses.h>

#include <algorithm>
#include <clocale>

#include "internal/cli/browser.hpp"
#include "internal/cli/status_formatter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_cache.hpp"
#include "internal/sync/sync_engine.hpp"

namespace rdash::tui {

using model::ServiceState;

namespace {

constexpr int kTickMs = 250;

enum ColorPair : short {
  kPairHeader = 1,
  kPairRunning,
  kPairDeploying,
  kPairFailed,
  kPairMuted,
  kPairSelected,
  kPairHelp,
};

short PairFor(ServiceState state) {
  switch (state) {
    case ServiceState::kRunning:
      return kPairRunning;
    case ServiceState::kDeploying:
      return kPairDeploying;
    case ServiceState::kFailed:
      return kPairFailed;
    case ServiceState::kSuspended:
    case ServiceState::kUnknown:
    default:
      return kPairMuted;
  }
}

// initscr/endwin pairing; endwin also runs when Run() unwinds.
class CursesSession {
 public:
  CursesSession() {
    std::setlocale(LC_ALL, ""); // box drawing and bullets are UTF-8
    initscr();
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(kTickMs);

    if (has_colors()) {
      start_color();
      use_default_colors();
      init_pair(kPairHeader, COLOR_CYAN, -1);
      init_pair(kPairRunning, COLOR_GREEN, -1);
      init_pair(kPairDeploying, COLOR_YELLOW, -1);
      init_pair(kPairFailed, COLOR_RED, -1);
      init_pair(kPairMuted, COLOR_WHITE, -1);
      init_pair(kPairSelected, COLOR_YELLOW, -1);
      init_pair(kPairHelp, COLOR_BLACK, COLOR_WHITE);
    }
  }

  ~CursesSession() {
    endwin();
  }

  CursesSession(const CursesSession&)            = delete;
  CursesSession& operator=(const CursesSession&) = delete;
};

void PutLine(int row, int col, int width, const std::string& text, attr_t attr = A_NORMAL) {
  if (width <= col) return;
  attron(attr);
  mvaddnstr(row, col, text.c_str(), width - col);
  attroff(attr);
}

} // namespace

std::string DeployLine(const model::StatusSnapshot& snapshot, util::TimePoint now) {
  if (!snapshot.has_data()) {
    return snapshot.last_error ? "└─ No data yet" : "└─ Loading...";
  }
  if (!snapshot.latest_deploy) return "└─ No deployments";

  const auto& deploy = *snapshot.latest_deploy;
  const auto  ago    = util::TimeAgo(deploy.started_at, now);
  if (model::IsInProgress(deploy.state)) return "└─ Deploy started: " + ago;
  return "└─ Last deploy: " + ago + " (" + std::string(model::ToString(deploy.state)) + ")";
}

std::string StalenessLabel(bool cycle_running, const std::optional<std::chrono::steady_clock::duration>& since_start) {
  if (cycle_running) return "Refreshing...";
  if (!since_start) return "Waiting for first refresh";
  return "Updated " + util::TimeAgo(std::chrono::duration_cast<std::chrono::seconds>(*since_start));
}

Dashboard::Dashboard(std::vector<model::ServiceRecord> services, std::shared_ptr<status::StatusCache> cache,
                     std::shared_ptr<sync::SyncEngine> engine)
    : services_(std::move(services)), cache_(std::move(cache)), engine_(std::move(engine)) {
}

void Dashboard::Run() {
  CursesSession session;

  while (true) {
    Draw();
    const int ch = getch();
    if (ch != ERR && !HandleKey(ch)) break;
  }
}

// ------------------------------------------------------------
// Drawing
// ------------------------------------------------------------

void Dashboard::Draw() {
  int rows = 0;
  int cols = 0;
  getmaxyx(stdscr, rows, cols);
  erase();

  const auto header = "Render Services Dashboard";
  const auto stale  = StalenessLabel(engine_->IsCycleRunning(), engine_->TimeSinceLastCycleStart());
  PutLine(0, 0, cols, header, COLOR_PAIR(kPairHeader) | A_BOLD);
  PutLine(0, std::max(0, cols - static_cast<int>(stale.size()) - 1), cols, stale, COLOR_PAIR(kPairHeader));

  if (selected_ < offset_) offset_ = selected_;

  const int body_top    = 2;
  const int body_bottom = rows - 2;

  // scroll down until the selected card fits
  while (true) {
    int    row        = body_top;
    size_t last_drawn = offset_;
    for (size_t i = offset_; i < services_.size() && row < body_bottom; ++i) {
      const auto snapshot = cache_->Get(services_[i].id);
      row                 = DrawCard(row, body_bottom, cols, services_[i], snapshot, i == selected_) + 1;
      if (row <= body_bottom) last_drawn = i;
    }
    if (selected_ <= last_drawn || offset_ >= selected_) break;

    ++offset_;
    for (int r = body_top; r < body_bottom; ++r) {
      move(r, 0);
      clrtoeol();
    }
  }

  const auto now = util::Now();
  if (!flash_.empty() && now < flash_until_) {
    PutLine(rows - 2, 0, cols, flash_, COLOR_PAIR(kPairDeploying));
  }

  const std::string help = " r Refresh  q Quit  ↑/↓ Select  l Logs  e Events  d Deploys  s Settings ";
  PutLine(rows - 1, 0, cols, help + std::string(std::max(0, cols - static_cast<int>(help.size())), ' '), COLOR_PAIR(kPairHelp));

  refresh();
}

int Dashboard::DrawCard(int row, int max_row, int width, const model::ServiceRecord& record, const model::StatusSnapshot& snapshot,
                        bool selected) {
  if (row >= max_row) return row;

  const auto name  = snapshot.service_name ? *snapshot.service_name : record.name;
  const auto state = cli::TitleCase(model::ToString(snapshot.service_state));
  const auto bullet = snapshot.service_state == ServiceState::kSuspended ? "○ " : "● ";

  int col = 0;
  PutLine(row, col, width, selected ? "> " : "  ", COLOR_PAIR(kPairSelected) | A_BOLD);
  col += 2;
  PutLine(row, col, width, name, selected ? A_BOLD : A_NORMAL);
  col += static_cast<int>(name.size()) + 2;
  PutLine(row, col, width, bullet + state, COLOR_PAIR(PairFor(snapshot.service_state)));
  col += static_cast<int>(state.size()) + 4;
  PutLine(row, col, width, record.id, A_DIM);
  if (snapshot.in_flight) {
    col += static_cast<int>(record.id.size()) + 2;
    PutLine(row, col, width, "[refreshing]", A_DIM);
  }
  ++row;

  if (row < max_row && snapshot.service_url) {
    PutLine(row++, 4, width, *snapshot.service_url, A_DIM);
  }
  if (row < max_row) {
    PutLine(row++, 4, width, DeployLine(snapshot, util::Now()), A_DIM);
  }
  if (row < max_row && snapshot.last_error) {
    PutLine(row++, 4, width, "! " + snapshot.last_error->message, COLOR_PAIR(kPairFailed));
  }
  return row;
}

// ------------------------------------------------------------
// Input
// ------------------------------------------------------------

bool Dashboard::HandleKey(int ch) {
  switch (ch) {
    case 'q':
    case 'Q':
    case 27:
    case 3: // ctrl-c in raw mode
      return false;
    case 'r':
    case 'R':
      engine_->TriggerManualRefresh();
      break;
    case KEY_UP:
    case 'k':
      if (selected_ > 0) --selected_;
      break;
    case KEY_DOWN:
    case 'j':
      if (selected_ + 1 < services_.size()) ++selected_;
      break;
    case KEY_HOME:
      selected_ = 0;
      break;
    case KEY_END:
      selected_ = services_.empty() ? 0 : services_.size() - 1;
      break;
    case 'l':
    case 'L':
      OpenSelected(cli::Action::kLogs);
      break;
    case 'e':
    case 'E':
      OpenSelected(cli::Action::kEvents);
      break;
    case 'd':
    case 'D':
      OpenSelected(cli::Action::kDeploys);
      break;
    case 's':
    case 'S':
      OpenSelected(cli::Action::kSettings);
      break;
    default:
      break;
  }
  return true;
}

void Dashboard::OpenSelected(cli::Action action) {
  if (services_.empty()) return;

  const auto& record = services_[selected_];
  const auto  url    = cli::DashboardUrl(record.id, action);

  flash_       = cli::OpenInBrowser(url) ? "Opened " + url : "Open manually: " + url;
  flash_until_ = util::Now() + std::chrono::seconds(5);
  observability::LogInfo("dashboard action", {observability::StringField("service", record.id), observability::StringField("action", cli::ToString(action))});
}

} // namespace rdash::tui
