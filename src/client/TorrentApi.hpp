#pragma once

#include "client/ActionOrchestrator.hpp"
#include "client/RequestCoordinator.hpp"
#include "client/Response.hpp"
#include "client/TorrentCache.hpp"
#include "client/Transport.hpp"
#include "model/Convert.hpp"
#include "model/Filter.hpp"

#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tr::client
{

enum class FilePriorityChange
{
    High,
    Normal,
    Low,
    // Do not download at all.
    Shun,
};

struct AllFiles
{
};

// (torrent ID, file index) pairs.
using FileIds = std::vector<std::pair<int, int>>;
using FileSelection =
    std::variant<AllFiles, model::FileFilterPtr, std::string, FileIds>;

using Clock = std::function<std::time_t()>;

// Every torrent operation of one daemon connection. Owns the cache; all
// calls and the transport's event loop must run on the same thread.
class TorrentApi
{
  public:
    explicit TorrentApi(Transport &transport,
                        model::FilterCompiler filter_compiler = {},
                        model::FileFilterCompiler file_filter_compiler = {},
                        model::UnitOptions units = {});

    TorrentApi(TorrentApi const &) = delete;
    TorrentApi &operator=(TorrentApi const &) = delete;

    void torrents(Selector const &selector, std::vector<std::string> keys,
                  TorrentsCallback callback);

    // `source` is a local .torrent file, a 40 character info hash or
    // anything the daemon accepts as a link. The result is built from the
    // daemon's reply and is not cached.
    void add(std::string source, bool stopped, std::optional<std::string> path,
             TorrentCallback callback);

    void stop(Selector const &selector, TorrentsCallback callback);
    void start(Selector const &selector, bool force, TorrentsCallback callback);
    void toggle_stopped(Selector const &selector, bool force,
                        TorrentsCallback callback);
    void verify(Selector const &selector, TorrentsCallback callback);
    void remove(Selector const &selector, bool delete_files,
                TorrentsCallback callback);
    void move(Selector const &selector, std::string path,
              TorrentsCallback callback);
    void file_priority(Selector const &selector, FilePriorityChange priority,
                       FileSelection files, TorrentsCallback callback);

    // No rate (or a rate <= 0) removes the limit.
    void limit_rate_up(Selector const &selector, std::optional<std::string> rate,
                       TorrentsCallback callback);
    void limit_rate_down(Selector const &selector,
                         std::optional<std::string> rate,
                         TorrentsCallback callback);

    void tracker_add(Selector const &selector, std::vector<std::string> urls,
                     TorrentsCallback callback);
    // With `partial`, a URL also matches trackers whose announce URL
    // contains it.
    void tracker_remove(Selector const &selector, std::vector<std::string> urls,
                        bool partial, TorrentsCallback callback);
    void announce(Selector const &selector, TorrentsCallback callback);

    void set_clock(Clock clock) { clock_ = std::move(clock); }

    TorrentCache const &cache() const noexcept { return cache_; }
    RequestCoordinator &coordinator() noexcept { return coordinator_; }

  private:
    struct ActionJob
    {
        // Absent: only `notes` are reported.
        std::optional<ActionSpec> spec;
        std::vector<int> ids;
        Messages notes;
    };

    struct Batch
    {
        std::vector<ActionJob> jobs;
        std::size_t next = 0;
        TorrentsResponse merged;
        TorrentsCallback done;
    };

    // Runs jobs one after another; torrents and messages are concatenated
    // and the batch succeeds if any job did.
    void run_jobs(std::vector<ActionJob> jobs, TorrentsCallback callback);
    void run_next(std::shared_ptr<Batch> batch);

    void limit_rate(bool upload, Selector const &selector,
                    std::optional<std::string> rate, TorrentsCallback callback);
    void submit_add(std::string source, bool stopped,
                    std::optional<std::string> download_dir,
                    TorrentCallback callback);

    TorrentCache cache_;
    RequestCoordinator coordinator_;
    ActionOrchestrator orchestrator_;
    model::FileFilterCompiler file_filter_compiler_;
    model::UnitOptions units_;
    Clock clock_;
};

} // namespace tr::client
