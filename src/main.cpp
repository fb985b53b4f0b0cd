/**
 * SaveKeeper - automatic game save backups
 *
 * Runs as a small GLib daemon that watches every configured save
 * location and keeps a rolling set of snapshots of it. The same binary
 * also offers one-shot commands:
 * - list     show an entity's snapshots
 * - backup   take a manual snapshot
 * - restore  roll an entity back to a snapshot
 * - status   show configured entities and their backup usage
 */

#include "logger.hpp"
#include "settings.hpp"
#include "entity_profile.hpp"
#include "entity_lock.hpp"
#include "snapshot_engine.hpp"
#include "restore_coordinator.hpp"
#include "watch_manager.hpp"
#include "notifications.hpp"
#include "fs_utils.hpp"
#include <chrono>
#include <iostream>
#include <iomanip>
#include <memory>
#include <optional>
#include <algorithm>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <climits>
#include <ctime>
#include <string>
#include <vector>
#include <map>
#include <gio/gio.h>
#include <glib-unix.h>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <signal.h>
#include <execinfo.h>

namespace fs = std::filesystem;
using namespace savekeeper;

namespace {

struct CommandLine {
    std::string config_path;
    std::string profiles_path;
    bool debug = false;
    bool quiet = false;
    std::vector<std::string> command;  // empty: run the daemon
};

/**
 * Everything the daemon builds from settings, torn down in reverse order
 */
struct Daemon {
    std::unique_ptr<SettingsManager> settings;
    std::unique_ptr<ProfileRegistry> profiles;
    EntityLockTable locks;
    std::unique_ptr<SnapshotEngine> engine;
    std::unique_ptr<RestoreCoordinator> restorer;
    std::unique_ptr<WatchManager> manager;

    // Main loop only
    std::map<std::string, EntityStatus> last_status;
    std::map<std::string, std::string> last_snapshot;
};

GApplication* global_app = nullptr;
Daemon* global_daemon = nullptr;

std::string cache_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.cache/savekeeper" : "/tmp";
}

} // namespace

// Filled in before the handlers are installed; the handler itself only uses
// async-signal-safe calls
static char crash_file[PATH_MAX];
static char crash_header[1024];

static void write_str(int fd, const char* text) {
    size_t len = strlen(text);
    while (len > 0) {
        ssize_t n = write(fd, text, len);
        if (n <= 0) return;
        text += n;
        len -= static_cast<size_t>(n);
    }
}

/**
 * Crash handler - appends the run context and a raw backtrace to crash.log
 * next to the log file
 */
static void crash_handler(int sig) {
    int fd = open(crash_file, O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) fd = STDERR_FILENO;

    char sig_buf[16];
    int pos = sizeof(sig_buf) - 1;
    sig_buf[pos] = '\0';
    int value = sig;
    do {
        sig_buf[--pos] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value > 0 && pos > 0);

    write_str(fd, "\n--- savekeeper crash, signal ");
    write_str(fd, sig_buf + pos);
    write_str(fd, " ---\n");
    write_str(fd, crash_header);

    void* stack[64];
    int depth = backtrace(stack, 64);
    backtrace_symbols_fd(stack, depth, fd);
    write_str(fd, "---\n");

    if (fd != STDERR_FILENO) {
        close(fd);
        write_str(STDERR_FILENO, "savekeeper crashed, backtrace appended to ");
        write_str(STDERR_FILENO, crash_file);
        write_str(STDERR_FILENO, "\n");
    }

    signal(sig, SIG_DFL);
    raise(sig);
}

/**
 * Graceful shutdown for SIGTERM/SIGINT, run from the main loop
 */
static gboolean shutdown_handler_glib(gpointer /*user_data*/) {
    Logger::info("[Shutdown] Signal received, stopping watches...");

    if (global_daemon && global_daemon->manager) {
        global_daemon->manager->shutdown();
        Logger::info("[Shutdown] Watch manager stopped");
    }

    if (global_app) {
        g_application_quit(global_app);
    }
    return G_SOURCE_REMOVE;
}

static void install_crash_handlers(const CommandLine& cmd, const Daemon& daemon, const std::string& log_file) {
    fs::path dir = fs::path(log_file).parent_path();
    if (dir.empty()) dir = cache_dir();
    snprintf(crash_file, sizeof(crash_file), "%s", (dir / "crash.log").c_str());

    std::string mode = "daemon";
    for (const auto& arg : cmd.command) {
        mode += (mode == "daemon" ? std::string(": ") : std::string(" ")) + arg;
    }
    time_t now = time(nullptr);
    char started[32];
    strftime(started, sizeof(started), "%Y-%m-%d %H:%M:%S", localtime(&now));

    std::string header = "pid " + std::to_string(getpid()) + ", started " + started + ", " + mode + "\n" +
                         "backup root " + daemon.settings->get_backup_root() + "\n" +
                         "An interrupted restore leaves hidden .<name>.restore-* or .<name>.aside-* "
                         "directories beside the save folder; the safety snapshot is under <backup root>/<entity>/safety\n";
    snprintf(crash_header, sizeof(crash_header), "%s", header.c_str());

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = crash_handler;
    sigemptyset(&action.sa_mask);
    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS, SIGILL}) {
        sigaction(sig, &action, nullptr);
    }
}

static void install_shutdown_handlers() {
    g_unix_signal_add(SIGTERM, shutdown_handler_glib, nullptr);
    g_unix_signal_add(SIGINT, shutdown_handler_glib, nullptr);
    Logger::debug("[Init] Signal handlers installed");
}

/**
 * Ensure only one daemon is running per user
 * Returns true if this is the only instance, false otherwise
 */
static bool ensure_single_instance() {
    std::string runtime_dir = "/run/user/" + std::to_string(getuid());
    std::string lock_file = runtime_dir + "/savekeeper.lock";

    std::error_code ec;
    if (!fs::exists(runtime_dir, ec)) {
        const char* xdg_runtime = std::getenv("XDG_RUNTIME_DIR");
        if (xdg_runtime) {
            lock_file = std::string(xdg_runtime) + "/savekeeper.lock";
        } else {
            lock_file = "/tmp/savekeeper-" + std::to_string(getuid()) + ".lock";
        }
    }

    int lock_fd = open(lock_file.c_str(), O_CREAT | O_RDWR, 0600);
    if (lock_fd < 0) {
        Logger::error("[SingleInstance] Failed to create lock file: " + lock_file);
        return true;
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        close(lock_fd);
        Logger::error("[SingleInstance] Another savekeeper daemon is already running");
        std::cerr << "savekeeper is already running\n";
        return false;
    }

    if (ftruncate(lock_fd, 0) == 0) {
        std::string pid = std::to_string(getpid());
        if (write(lock_fd, pid.c_str(), pid.length()) < 0) {
            Logger::error("[SingleInstance] Failed to write PID to lock file");
        }
    }

    Logger::info("[SingleInstance] Acquired lock file: " + lock_file);
    // lock_fd stays open until exit
    return true;
}

static void print_usage() {
    std::cout << "SaveKeeper - automatic game save backups\n\n"
              << "Usage: savekeeper [options] [command]\n\n"
              << "Commands:\n"
              << "  (none)                        Run the backup daemon\n"
              << "  list <entity>                 List snapshots, newest first\n"
              << "  backup <entity>               Take a manual snapshot\n"
              << "  restore <entity> <snapshot>   Restore a snapshot\n"
              << "  status                        Show entities and backup usage\n\n"
              << "Options:\n"
              << "  --config PATH     Settings file (default ~/.config/savekeeper/settings.json)\n"
              << "  --profiles PATH   Profiles file (default ~/.config/savekeeper/profiles.json)\n"
              << "  --debug           Enable debug logging\n"
              << "  --quiet           Only log to the log file\n"
              << "  --help            Show this help message\n";
}

// Returns -1 to continue, otherwise the exit code
static int parse_command_line(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            cmd.debug = true;
        } else if (arg == "--quiet") {
            cmd.quiet = true;
        } else if (arg == "--config" || arg == "--profiles") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a path\n";
                return 2;
            }
            (arg == "--config" ? cmd.config_path : cmd.profiles_path) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 2;
        } else {
            cmd.command.push_back(arg);
        }
    }
    return -1;
}

static ManagerOptions manager_options(const SettingsManager& settings) {
    ManagerOptions options;
    options.worker_threads = static_cast<size_t>(std::max(1, settings.get_worker_threads()));
    options.manual_wait = std::chrono::seconds(std::max(0, settings.get_manual_wait_seconds()));
    options.retry.max_attempts = settings.get_watch_retry_limit();
    options.retry.base_delay = std::chrono::milliseconds(settings.get_watch_retry_base_ms());
    options.retry.max_delay = std::chrono::milliseconds(settings.get_watch_retry_max_ms());
    return options;
}

static void load_configuration(const CommandLine& cmd, Daemon& daemon) {
    std::string config_path = cmd.config_path;
    if (config_path.empty()) {
        std::string dir = SettingsManager::default_config_dir();
        config_path = dir.empty() ? "settings.json" : dir + "/settings.json";
    }
    daemon.settings = std::make_unique<SettingsManager>(config_path);
    if (!daemon.settings->load()) {
        Logger::warn("[Init] Using default settings");
    }

    std::string profiles_path = cmd.profiles_path.empty() ? ProfileRegistry::defaultPath() : cmd.profiles_path;
    daemon.profiles = std::make_unique<ProfileRegistry>(profiles_path);
    if (!daemon.profiles->loadProfiles(*daemon.settings)) {
        Logger::warn("[Init] No profiles loaded from " + profiles_path);
    }

    daemon.engine = std::make_unique<SnapshotEngine>(daemon.locks);
    daemon.restorer = std::make_unique<RestoreCoordinator>(*daemon.engine);
}

static std::optional<EntityProfile> require_profile(const Daemon& daemon, const std::string& id) {
    auto profile = daemon.profiles->getProfile(id);
    if (!profile) {
        std::cerr << "Unknown entity: " << id << "\n";
    }
    return profile;
}

// ---- One-shot commands --------------------------------------------------

static int command_list(const Daemon& daemon, const std::string& entity_id) {
    auto profile = require_profile(daemon, entity_id);
    if (!profile) return 1;

    auto snapshots = daemon.engine->list(*profile);
    if (snapshots.empty()) {
        std::cout << "No snapshots for " << profile->display_name << "\n";
        return 0;
    }
    for (const auto& s : snapshots) {
        std::cout << std::left << std::setw(24) << s.id
                  << std::setw(11) << to_string(s.kind)
                  << std::setw(22) << format_local_time(s.timestamp)
                  << std::right << std::setw(10) << fsutil::format_file_size(s.size_bytes)
                  << (s.complete ? "" : "  incomplete") << "\n";
    }
    return 0;
}

static int command_backup(Daemon& daemon, const std::string& entity_id) {
    auto profile = require_profile(daemon, entity_id);
    if (!profile) return 1;

    auto wait = std::chrono::seconds(std::max(0, daemon.settings->get_manual_wait_seconds()));
    SnapshotResult result = daemon.engine->create(*profile, SnapshotKind::Manual, wait);
    if (!result.ok()) {
        std::cerr << "Backup failed: " << (result.error.empty() ? "entity busy" : result.error) << "\n";
        return 1;
    }
    std::cout << "Created " << result.snapshot->id << " ("
              << fsutil::format_file_size(result.snapshot->size_bytes) << ")\n";
    for (const auto& id : result.pruned) {
        std::cout << "Pruned " << id << "\n";
    }
    for (const auto& warning : result.retention_warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
    return 0;
}

static int command_restore(Daemon& daemon, const std::string& entity_id, const std::string& snapshot_id) {
    auto profile = require_profile(daemon, entity_id);
    if (!profile) return 1;

    auto wait = std::chrono::seconds(std::max(0, daemon.settings->get_manual_wait_seconds()));
    RestoreResult result = daemon.restorer->restore(*profile, snapshot_id, wait);
    if (!result.ok()) {
        std::cerr << "Restore failed (" << to_string(result.status) << "): " << result.error << "\n";
        if (result.status == RestoreResult::Status::SwapFailed && !result.reinstated) {
            std::cerr << "The live save folder could not be recovered automatically; "
                      << "restore safety snapshot " << result.safety_snapshot_id << " manually.\n";
        }
        return 1;
    }
    std::cout << "Restored " << snapshot_id << "\n"
              << "Safety snapshot: " << result.safety_snapshot_id << "\n";
    return 0;
}

static int command_status(const Daemon& daemon) {
    auto profiles = daemon.profiles->getAllProfiles();
    if (profiles.empty()) {
        std::cout << "No entities configured in " << daemon.profiles->path() << "\n";
        return 0;
    }
    for (const auto& p : profiles) {
        auto snapshots = daemon.engine->list(p);
        std::cout << std::left << std::setw(20) << p.id
                  << std::setw(28) << p.display_name
                  << std::setw(10) << (p.enabled ? "enabled" : "disabled")
                  << std::right << std::setw(4) << snapshots.size() << " snapshots  "
                  << fsutil::format_file_size(daemon.engine->backup_size(p)) << "\n";
    }
    return 0;
}

static int run_command(const CommandLine& cmd, Daemon& daemon) {
    const std::string& name = cmd.command[0];
    size_t args = cmd.command.size() - 1;

    if (name == "list" && args == 1) return command_list(daemon, cmd.command[1]);
    if (name == "backup" && args == 1) return command_backup(daemon, cmd.command[1]);
    if (name == "restore" && args == 2) return command_restore(daemon, cmd.command[1], cmd.command[2]);
    if (name == "status" && args == 0) return command_status(daemon);

    std::cerr << "Invalid command: " << name << "\n";
    print_usage();
    return 2;
}

// ---- Daemon ------------------------------------------------------------

/**
 * Runs on the main loop for every event the manager emits
 */
static void handle_event_on_main(const BackupEvent& event) {
    if (!global_daemon) return;

    std::string name = event.entity_id;
    if (auto profile = global_daemon->profiles->getProfile(event.entity_id)) {
        name = profile->display_name;
    }

    EntityStatus previous = EntityStatus::Idle;
    auto it = global_daemon->last_status.find(event.entity_id);
    if (it != global_daemon->last_status.end()) previous = it->second;
    global_daemon->last_status[event.entity_id] = event.status;

    Logger::debug("[Daemon] " + event.entity_id + " -> " + to_string(event.status));

    auto& notifications = NotificationManager::getInstance();
    if (event.status == EntityStatus::Error && previous != EntityStatus::Error) {
        if (event.persistent_failure) {
            notifications.notify_watch_failure(name, event.last_error);
        } else if (previous == EntityStatus::BackingUp) {
            notifications.notify_backup_failed(name, event.last_error);
        } else if (previous == EntityStatus::Restoring) {
            notifications.notify_restore_failed(name, event.last_error);
        }
    } else if (previous == EntityStatus::Restoring && event.status != EntityStatus::Restoring &&
               !event.restored_snapshot_id.empty()) {
        notifications.notify_restore_complete(name, event.restored_snapshot_id, event.safety_snapshot_id);
    } else if (previous == EntityStatus::BackingUp && event.status != EntityStatus::BackingUp &&
               !event.last_snapshot_id.empty() &&
               global_daemon->last_snapshot[event.entity_id] != event.last_snapshot_id) {
        notifications.notify_backup_created(name, event.last_snapshot_id, event.last_snapshot_size);
    }
    global_daemon->last_snapshot[event.entity_id] = event.last_snapshot_id;
}

static void on_activate(GApplication* app, gpointer user_data) {
    auto* daemon = static_cast<Daemon*>(user_data);
    if (daemon->manager) return;  // already running

    NotificationManager::getInstance().init(app);
    NotificationManager::getInstance().set_enabled(daemon->settings->get_show_notifications());

    daemon->manager = std::make_unique<WatchManager>(*daemon->engine, *daemon->restorer,
                                                     manager_options(*daemon->settings));

    // Events arrive on session and worker threads; hop onto the main loop
    daemon->manager->set_event_callback([](const BackupEvent& event) {
        struct EventData {
            BackupEvent event;
        };
        auto* data = new EventData{event};
        g_idle_add(+[](gpointer user_data) -> gboolean {
            auto* d = static_cast<EventData*>(user_data);
            handle_event_on_main(d->event);
            delete d;
            return G_SOURCE_REMOVE;
        }, data);
    });

    size_t added = 0;
    for (const auto& profile : daemon->profiles->getAllProfiles()) {
        std::string error;
        if (daemon->manager->add_entity(profile, &error)) {
            added++;
        } else {
            Logger::error("[Daemon] Skipping " + profile.id + ": " + error);
        }
    }

    size_t watching = daemon->manager->start_all();
    Logger::info("[Daemon] Watching " + std::to_string(watching) + " of " +
                 std::to_string(added) + " entities");

    g_application_hold(app);
}

static int run_daemon(char* argv[], Daemon& daemon) {
    if (!ensure_single_instance()) {
        return 1;
    }

    GApplication* app = g_application_new("io.savekeeper.daemon", G_APPLICATION_FLAGS_NONE);
    global_app = app;
    global_daemon = &daemon;

    install_shutdown_handlers();
    g_signal_connect(app, "activate", G_CALLBACK(on_activate), &daemon);

    // Options were consumed above; GApplication only sees the program name
    int status = g_application_run(app, 1, argv);

    Logger::info("[Shutdown] Main loop finished, cleaning up...");
    if (daemon.manager) {
        daemon.manager->shutdown();
        daemon.manager.reset();
    }
    if (!daemon.settings->save()) {
        Logger::warn("[Shutdown] Could not save settings");
    }

    global_daemon = nullptr;
    global_app = nullptr;
    g_object_unref(app);
    return status;
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    int exit_code = parse_command_line(argc, argv, cmd);
    if (exit_code >= 0) {
        return exit_code;
    }

    LogLevel level = cmd.debug ? LogLevel::DEBUG : LogLevel::INFO;
    Logger::init(level);
    // One-shot commands print their own results; keep the console for those
    Logger::set_console_enabled(!cmd.quiet && cmd.command.empty());

    Daemon daemon;
    load_configuration(cmd, daemon);

    if (daemon.settings->get_debug_logging()) {
        level = LogLevel::DEBUG;
    }
    std::string log_file = daemon.settings->get_log_file();
    if (log_file.empty()) {
        log_file = cache_dir() + "/savekeeper.log";
    }
    Logger::init(level, log_file);
    install_crash_handlers(cmd, daemon, log_file);

    if (!cmd.command.empty()) {
        exit_code = run_command(cmd, daemon);
        Logger::shutdown();
        return exit_code;
    }

    Logger::info("SaveKeeper - starting daemon");
    exit_code = run_daemon(argv, daemon);
    Logger::info("SaveKeeper - exiting");
    Logger::shutdown();
    return exit_code;
}
