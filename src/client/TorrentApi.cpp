#include "client/TorrentApi.hpp"

#include "model/Errors.hpp"
#include "utils/Base64.hpp"
#include "utils/FS.hpp"
#include "utils/InfoHash.hpp"
#include "utils/Log.hpp"
#include "utils/Url.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <format>
#include <iterator>
#include <map>
#include <set>
#include <span>
#include <stdexcept>
#include <system_error>

namespace tr::client
{

namespace
{

using model::Status;
using model::Torrent;

char const *plural(std::size_t count)
{
    return count == 1 ? "" : "s";
}

Status status_of(Torrent const &torrent)
{
    return torrent.get_as<Status>("status");
}

ActionSpec stop_spec()
{
    ActionSpec spec;
    spec.method = method::kTorrentStop;
    spec.check = [](Torrent const &torrent)
    {
        if (status_of(torrent) == Status::Stopped)
        {
            return Admission::reject("Already stopped: " + torrent.name());
        }
        return Admission::accept("Stopping " + torrent.name());
    };
    spec.check_fields = {"status"};
    return spec;
}

ActionSpec start_spec(bool force)
{
    ActionSpec spec;
    spec.method = force ? method::kTorrentStartNow : method::kTorrentStart;
    spec.check = [](Torrent const &torrent)
    {
        if (status_of(torrent) == Status::Stopped)
        {
            return Admission::accept("Starting " + torrent.name());
        }
        return Admission::reject("Already started: " + torrent.name());
    };
    spec.check_fields = {"status"};
    return spec;
}

ActionSpec file_priority_spec(FilePriorityChange priority,
                              std::vector<int> indexes)
{
    ActionSpec spec;
    spec.method = method::kTorrentSet;
    spec.arguments =
        [priority, indexes = std::move(indexes)](yyjson_mut_doc *doc,
                                                 yyjson_mut_val *root)
    {
        switch (priority)
        {
        case FilePriorityChange::High:
            yyjson_mut_obj_add_val(doc, root, "priority-high",
                                   json::int_array(doc, indexes));
            break;
        case FilePriorityChange::Normal:
            yyjson_mut_obj_add_val(doc, root, "priority-normal",
                                   json::int_array(doc, indexes));
            break;
        case FilePriorityChange::Low:
            yyjson_mut_obj_add_val(doc, root, "priority-low",
                                   json::int_array(doc, indexes));
            break;
        case FilePriorityChange::Shun:
            yyjson_mut_obj_add_val(doc, root, "files-unwanted",
                                   json::int_array(doc, indexes));
            return;
        }
        yyjson_mut_obj_add_val(doc, root, "files-wanted",
                               json::int_array(doc, indexes));
    };
    spec.return_fields = {"files"};
    return spec;
}

// Limit in kB/s; nullopt disables the limit.
ActionSpec rate_limit_spec(bool upload, std::optional<std::int64_t> kilobytes)
{
    ActionSpec spec;
    spec.method = method::kTorrentSet;
    spec.arguments = [upload, kilobytes](yyjson_mut_doc *doc,
                                         yyjson_mut_val *root)
    {
        yyjson_mut_obj_add_bool(doc, root,
                                upload ? "uploadLimited" : "downloadLimited",
                                kilobytes.has_value());
        if (kilobytes)
        {
            yyjson_mut_obj_add_sint(doc, root,
                                    upload ? "uploadLimit" : "downloadLimit",
                                    *kilobytes);
        }
    };
    spec.return_fields = {upload ? "rate-limit-up" : "rate-limit-down"};
    return spec;
}

std::optional<std::int64_t> daemon_limit(std::optional<double> bytes_per_second)
{
    if (!bytes_per_second)
    {
        return std::nullopt;
    }
    auto kilobytes = model::to_daemon_kilobytes(*bytes_per_second);
    if (kilobytes <= 0)
    {
        return std::nullopt;
    }
    return kilobytes;
}

ActionSpec tracker_spec(char const *argument,
                        std::function<yyjson_mut_val *(yyjson_mut_doc *)> values)
{
    ActionSpec spec;
    spec.method = method::kTorrentSet;
    spec.arguments = [argument, values = std::move(values)](
                         yyjson_mut_doc *doc, yyjson_mut_val *root)
    { yyjson_mut_obj_add_val(doc, root, argument, values(doc)); };
    spec.return_fields = {"trackers"};
    return spec;
}

std::string lowered(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return text;
}

} // namespace

TorrentApi::TorrentApi(Transport &transport,
                       model::FilterCompiler filter_compiler,
                       model::FileFilterCompiler file_filter_compiler,
                       model::UnitOptions units)
    : coordinator_(transport, cache_, std::move(filter_compiler)),
      orchestrator_(coordinator_),
      file_filter_compiler_(std::move(file_filter_compiler)), units_(units),
      clock_([]
             { return std::chrono::system_clock::to_time_t(
                   std::chrono::system_clock::now()); })
{
}

void TorrentApi::torrents(Selector const &selector,
                          std::vector<std::string> keys,
                          TorrentsCallback callback)
{
    coordinator_.resolve(selector, std::move(keys), std::move(callback));
}

void TorrentApi::add(std::string source, bool stopped,
                     std::optional<std::string> path, TorrentCallback callback)
{
    if (!path)
    {
        submit_add(std::move(source), stopped, std::nullopt,
                   std::move(callback));
        return;
    }
    coordinator_.absolute_download_path(
        std::move(*path),
        [this, source = std::move(source), stopped,
         callback = std::move(callback)](PathResponse resolved) mutable
        {
            if (!resolved.success)
            {
                callback(TorrentResponse::failed(std::move(resolved.messages)));
                return;
            }
            submit_add(std::move(source), stopped, std::move(resolved.result),
                       std::move(callback));
        });
}

void TorrentApi::submit_add(std::string source, bool stopped,
                            std::optional<std::string> download_dir,
                            TorrentCallback callback)
{
    auto arguments = json::MutableDocument::object();
    auto *doc = arguments.doc();
    auto *root = arguments.root();
    yyjson_mut_obj_add_bool(doc, root, "paused", stopped);
    if (download_dir)
    {
        yyjson_mut_obj_add_strncpy(doc, root, "download-dir",
                                   download_dir->data(), download_dir->size());
    }

    auto local = utils::expand_user(source);
    std::error_code ec;
    if (std::filesystem::exists(local, ec))
    {
        auto contents = utils::read_file_bytes(local, ec);
        if (!contents)
        {
            callback(TorrentResponse::failed({Message::error(
                std::format("{}: {}", ec.message(), local.string()))}));
            return;
        }
        auto metainfo = utils::encode_base64(
            std::span<std::uint8_t const>(contents->data(), contents->size()));
        yyjson_mut_obj_add_strncpy(doc, root, "metainfo", metainfo.data(),
                                   metainfo.size());
        source = local.string();
    }
    else if (auto magnet = utils::magnet_from_info_hash(source))
    {
        yyjson_mut_obj_add_strncpy(doc, root, "filename", magnet->data(),
                                   magnet->size());
    }
    else
    {
        yyjson_mut_obj_add_strncpy(doc, root, "filename", source.data(),
                                   source.size());
    }
    TR_LOG_INFO("adding torrent {}", source);

    coordinator_.transport().call(
        method::kTorrentAdd, std::move(arguments),
        [source = std::move(source),
         callback = std::move(callback)](RpcReply reply)
        {
            if (!reply.ok())
            {
                if (reply.error->find("Invalid or corrupt") != std::string::npos)
                {
                    callback(TorrentResponse::failed({Message::error(
                        std::format("Invalid or corrupt torrent: '{}'", source))}));
                    return;
                }
                callback(TorrentResponse::failed({Message::error(*reply.error)}));
                return;
            }
            auto *duplicate = json::member(reply.arguments, "torrent-duplicate");
            auto *record = duplicate != nullptr
                               ? duplicate
                               : json::member(reply.arguments, "torrent-added");
            if (record == nullptr)
            {
                throw ProtocolError(std::format("malformed torrent-add reply: {}",
                                                json::write(reply.arguments)));
            }
            auto *id = json::member(record, "id");
            if (id == nullptr || !yyjson_is_int(id))
            {
                throw ProtocolError(std::format(
                    "torrent-add reply without torrent id: {}",
                    json::write(record)));
            }
            auto torrent = std::make_shared<Torrent>(
                static_cast<int>(yyjson_get_sint(id)));
            torrent->update(reply.document, record);

            TorrentResponse response;
            response.success = duplicate == nullptr;
            response.messages.push_back(Message::info(
                duplicate != nullptr ? "Torrent already exists: " + torrent->name()
                                     : "Added " + torrent->name()));
            response.result = std::move(torrent);
            callback(std::move(response));
        });
}

void TorrentApi::stop(Selector const &selector, TorrentsCallback callback)
{
    orchestrator_.run(stop_spec(), selector, std::move(callback));
}

void TorrentApi::start(Selector const &selector, bool force,
                       TorrentsCallback callback)
{
    orchestrator_.run(start_spec(force), selector, std::move(callback));
}

void TorrentApi::toggle_stopped(Selector const &selector, bool force,
                                TorrentsCallback callback)
{
    coordinator_.resolve(
        selector, {"id", "name", "status"},
        [this, force, callback = std::move(callback)](
            TorrentsResponse selected) mutable
        {
            if (!selected.success)
            {
                callback(TorrentsResponse::failed(std::move(selected.messages)));
                return;
            }
            std::vector<int> stopped;
            std::vector<int> running;
            for (auto const &torrent : selected.result)
            {
                (status_of(*torrent) == Status::Stopped ? stopped : running)
                    .push_back(torrent->id());
            }
            std::vector<ActionJob> jobs;
            if (!running.empty())
            {
                jobs.push_back(ActionJob{stop_spec(), std::move(running), {}});
            }
            if (!stopped.empty())
            {
                jobs.push_back(
                    ActionJob{start_spec(force), std::move(stopped), {}});
            }
            run_jobs(std::move(jobs), std::move(callback));
        });
}

void TorrentApi::verify(Selector const &selector, TorrentsCallback callback)
{
    ActionSpec spec;
    spec.method = method::kTorrentVerify;
    spec.check = [](Torrent const &torrent)
    {
        switch (status_of(torrent))
        {
        case Status::Verifying:
            return Admission::reject("Already verifying: " + torrent.name());
        case Status::VerifyPending:
            return Admission::reject("Already queued for verification: " +
                                     torrent.name());
        default:
            return Admission::accept("Verifying " + torrent.name());
        }
    };
    spec.check_fields = {"status"};
    orchestrator_.run(std::move(spec), selector, std::move(callback));
}

void TorrentApi::remove(Selector const &selector, bool delete_files,
                        TorrentsCallback callback)
{
    ActionSpec spec;
    spec.method = method::kTorrentRemove;
    spec.arguments = [delete_files](yyjson_mut_doc *doc, yyjson_mut_val *root)
    { yyjson_mut_obj_add_bool(doc, root, "delete-local-data", delete_files); };
    spec.check = [delete_files](Torrent const &torrent)
    {
        return Admission::accept(
            delete_files
                ? std::format("Deleting {} (including files)", torrent.name())
                : std::format("Removing {} (keeping files)", torrent.name()));
    };
    orchestrator_.run(std::move(spec), selector, std::move(callback));
}

void TorrentApi::move(Selector const &selector, std::string path,
                      TorrentsCallback callback)
{
    coordinator_.absolute_download_path(
        std::move(path),
        [this, selector, callback = std::move(callback)](
            PathResponse resolved) mutable
        {
            if (!resolved.success)
            {
                callback(TorrentsResponse::failed(std::move(resolved.messages)));
                return;
            }
            auto target = std::move(resolved.result);
            ActionSpec spec;
            spec.method = method::kTorrentSetLocation;
            spec.arguments = [target](yyjson_mut_doc *doc, yyjson_mut_val *root)
            {
                yyjson_mut_obj_add_strncpy(doc, root, "location", target.data(),
                                           target.size());
                yyjson_mut_obj_add_bool(doc, root, "move", true);
            };
            spec.check = [target](Torrent const &torrent)
            {
                auto current = utils::normalize_remote_path(
                    torrent.get_as<model::SmartString>("path").str());
                if (current != target)
                {
                    return Admission::accept(
                        std::format("Moved to {}: {}", target, torrent.name()));
                }
                return Admission::reject(
                    std::format("Already in {}: {}", target, torrent.name()));
            };
            spec.check_fields = {"path"};
            spec.return_fields = {"path"};
            orchestrator_.run(std::move(spec), selector, std::move(callback));
        });
}

void TorrentApi::file_priority(Selector const &selector,
                               FilePriorityChange priority, FileSelection files,
                               TorrentsCallback callback)
{
    // Resolved before anything is sent so that bad input fails early.
    std::function<model::FileList(model::FileList const &)> pick;
    bool const all = std::holds_alternative<AllFiles>(files);
    if (all)
    {
        pick = [](model::FileList const &list) { return list; };
    }
    else if (auto const *filter = std::get_if<model::FileFilterPtr>(&files))
    {
        if (!*filter)
        {
            throw std::invalid_argument("file filter is null");
        }
        pick = [filter = *filter](model::FileList const &list)
        { return filter->apply(list); };
    }
    else if (auto const *text = std::get_if<std::string>(&files))
    {
        if (!file_filter_compiler_)
        {
            throw std::invalid_argument(
                "file filter text given but no file filter compiler configured");
        }
        model::FileFilterPtr compiled;
        try
        {
            compiled = file_filter_compiler_(*text);
        }
        catch (FilterError const &ex)
        {
            callback(TorrentsResponse::failed({Message::error(ex.what())}));
            return;
        }
        if (!compiled)
        {
            throw std::invalid_argument(std::format(
                "file filter compiler returned nothing for '{}'", *text));
        }
        pick = [compiled](model::FileList const &list)
        { return compiled->apply(list); };
    }
    else
    {
        auto const &pairs = std::get<FileIds>(files);
        std::set<std::pair<int, int>> wanted(pairs.begin(), pairs.end());
        pick = [wanted = std::move(wanted)](model::FileList const &list)
        {
            model::FileList chosen;
            std::copy_if(list.begin(), list.end(), std::back_inserter(chosen),
                         [&wanted](model::TorrentFile const &file)
                         { return wanted.count({file.torrent_id, file.id}) > 0; });
            return chosen;
        };
    }

    coordinator_.resolve(
        selector, {"id", "name", "files"},
        [this, priority, all, pick = std::move(pick),
         callback = std::move(callback)](TorrentsResponse selected) mutable
        {
            if (!selected.success)
            {
                callback(TorrentsResponse::failed(std::move(selected.messages)));
                return;
            }
            auto torrents = std::move(selected.result);
            std::stable_sort(torrents.begin(), torrents.end(),
                             [](auto const &a, auto const &b)
                             { return lowered(a->name()) < lowered(b->name()); });

            std::vector<ActionJob> jobs;
            for (auto const &torrent : torrents)
            {
                auto chosen = pick(torrent->get_as<model::FileList>("files"));
                auto const count = chosen.size();
                ActionJob job;
                job.ids = {torrent->id()};
                if (all)
                {
                    job.notes.push_back(Message::info(std::format(
                        "{} file{}: {}", count, plural(count), torrent->name())));
                }
                else if (chosen.empty())
                {
                    job.notes.push_back(Message::error(
                        std::format("No matching files: {}", torrent->name())));
                }
                else
                {
                    job.notes.push_back(Message::info(
                        std::format("{} matching file{}: {}", count,
                                    plural(count), torrent->name())));
                }
                if (!chosen.empty())
                {
                    std::vector<int> indexes;
                    for (auto const &file : chosen)
                    {
                        indexes.push_back(file.id);
                    }
                    job.spec = file_priority_spec(priority, std::move(indexes));
                }
                jobs.push_back(std::move(job));
            }
            run_jobs(std::move(jobs), std::move(callback));
        });
}

void TorrentApi::limit_rate_up(Selector const &selector,
                               std::optional<std::string> rate,
                               TorrentsCallback callback)
{
    limit_rate(true, selector, std::move(rate), std::move(callback));
}

void TorrentApi::limit_rate_down(Selector const &selector,
                                 std::optional<std::string> rate,
                                 TorrentsCallback callback)
{
    limit_rate(false, selector, std::move(rate), std::move(callback));
}

void TorrentApi::limit_rate(bool upload, Selector const &selector,
                            std::optional<std::string> rate,
                            TorrentsCallback callback)
{
    model::RateLimit limit;
    if (rate)
    {
        auto parsed = model::parse_rate_limit(*rate);
        if (!parsed)
        {
            callback(TorrentsResponse::failed(
                {Message::error(std::format("Invalid rate: {}", *rate))}));
            return;
        }
        limit = *parsed;
    }
    std::string const key = upload ? "rate-limit-up" : "rate-limit-down";

    // The daemon's answer after the change is what gets reported.
    auto report = [this, upload, key, callback = std::move(callback)](
                      TorrentsResponse changed) mutable
    {
        if (!changed.success)
        {
            callback(std::move(changed));
            return;
        }
        Messages messages;
        for (auto const &torrent : changed.result)
        {
            auto const &current = torrent->get_as<model::Quantity>(key);
            messages.push_back(Message::info(std::format(
                "Limited {}load rate of {}: {}", upload ? "up" : "down",
                torrent->name(),
                current.is_infinite() ? std::string("unlimited")
                                      : torrent->format(key, units_))));
        }
        changed.messages = std::move(messages);
        callback(std::move(changed));
    };

    if (limit.mode == model::RateLimit::Mode::Set)
    {
        auto target = daemon_limit(model::resolve_rate_limit(limit, {}));
        orchestrator_.run(rate_limit_spec(upload, target), selector,
                          std::move(report));
        return;
    }

    // Relative changes depend on each torrent's current limit; torrents that
    // end up at the same limit share one call.
    coordinator_.resolve(
        selector, {"id", "name", key},
        [this, upload, key, limit,
         report = std::move(report)](TorrentsResponse selected) mutable
        {
            if (!selected.success)
            {
                report(TorrentsResponse::failed(std::move(selected.messages)));
                return;
            }
            std::map<std::optional<std::int64_t>, std::vector<int>> groups;
            for (auto const &torrent : selected.result)
            {
                auto target = model::resolve_rate_limit(
                    limit, torrent->get_as<model::Quantity>(key));
                groups[daemon_limit(target)].push_back(torrent->id());
            }
            std::vector<ActionJob> jobs;
            for (auto &[kilobytes, ids] : groups)
            {
                jobs.push_back(ActionJob{rate_limit_spec(upload, kilobytes),
                                         std::move(ids), {}});
            }
            run_jobs(std::move(jobs), std::move(report));
        });
}

void TorrentApi::tracker_add(Selector const &selector,
                             std::vector<std::string> urls,
                             TorrentsCallback callback)
{
    // Drop URLs that are given twice.
    std::vector<std::string> unique;
    for (auto &url : urls)
    {
        if (std::none_of(unique.begin(), unique.end(),
                         [&url](std::string const &seen)
                         { return net::urls_equal(seen, url); }))
        {
            unique.push_back(std::move(url));
        }
    }

    coordinator_.resolve(
        selector, {"id", "name", "trackers"},
        [this, urls = std::move(unique),
         callback = std::move(callback)](TorrentsResponse selected) mutable
        {
            if (!selected.success)
            {
                callback(TorrentsResponse::failed(std::move(selected.messages)));
                return;
            }
            Messages messages;
            std::map<std::vector<std::string>, std::vector<int>> groups;
            for (auto const &torrent : selected.result)
            {
                auto const &trackers =
                    torrent->get_as<model::TrackerList>("trackers");
                std::vector<std::string> missing;
                for (auto const &url : urls)
                {
                    auto const exists = std::any_of(
                        trackers.begin(), trackers.end(),
                        [&url](model::Tracker const &tracker)
                        { return net::urls_equal(tracker.announce, url); });
                    if (exists)
                    {
                        messages.push_back(Message::error(
                            std::format("{}: Tracker already exists: {}",
                                        torrent->name(), url)));
                    }
                    else
                    {
                        messages.push_back(Message::info(std::format(
                            "{}: Adding tracker: {}", torrent->name(), url)));
                        missing.push_back(url);
                    }
                }
                if (!missing.empty())
                {
                    groups[std::move(missing)].push_back(torrent->id());
                }
            }
            if (groups.empty())
            {
                callback(TorrentsResponse::failed(std::move(messages)));
                return;
            }
            std::vector<ActionJob> jobs;
            for (auto &[missing, ids] : groups)
            {
                auto spec = tracker_spec(
                    "trackerAdd", [missing = missing](yyjson_mut_doc *doc)
                    { return json::string_array(doc, missing); });
                jobs.push_back(ActionJob{std::move(spec), std::move(ids), {}});
            }
            jobs.front().notes = std::move(messages);
            run_jobs(std::move(jobs), std::move(callback));
        });
}

void TorrentApi::tracker_remove(Selector const &selector,
                                std::vector<std::string> urls, bool partial,
                                TorrentsCallback callback)
{
    coordinator_.resolve(
        selector, {"id", "name", "trackers"},
        [this, urls = std::move(urls), partial,
         callback = std::move(callback)](TorrentsResponse selected) mutable
        {
            if (!selected.success)
            {
                callback(TorrentsResponse::failed(std::move(selected.messages)));
                return;
            }
            Messages messages;
            std::vector<bool> matched(urls.size(), false);
            std::vector<ActionJob> jobs;
            for (auto const &torrent : selected.result)
            {
                std::vector<int> tracker_ids;
                for (auto const &tracker :
                     torrent->get_as<model::TrackerList>("trackers"))
                {
                    bool hit = false;
                    for (std::size_t i = 0; i < urls.size(); ++i)
                    {
                        if (net::urls_equal(urls[i], tracker.announce) ||
                            (partial &&
                             tracker.announce.find(urls[i]) != std::string::npos))
                        {
                            matched[i] = true;
                            hit = true;
                        }
                    }
                    if (hit)
                    {
                        tracker_ids.push_back(tracker.id);
                        messages.push_back(Message::info(
                            std::format("{}: Removing tracker: {}",
                                        torrent->name(), tracker.announce)));
                    }
                }
                if (!tracker_ids.empty())
                {
                    auto spec = tracker_spec(
                        "trackerRemove",
                        [tracker_ids](yyjson_mut_doc *doc)
                        { return json::int_array(doc, tracker_ids); });
                    jobs.push_back(ActionJob{std::move(spec), {torrent->id()}, {}});
                }
            }
            for (std::size_t i = 0; i < urls.size(); ++i)
            {
                if (!matched[i])
                {
                    messages.push_back(Message::error(
                        std::format("No matching trackers found: '{}'", urls[i])));
                }
            }
            if (jobs.empty())
            {
                callback(TorrentsResponse::failed(std::move(messages)));
                return;
            }
            jobs.front().notes = std::move(messages);
            run_jobs(std::move(jobs), std::move(callback));
        });
}

void TorrentApi::announce(Selector const &selector, TorrentsCallback callback)
{
    ActionSpec spec;
    spec.method = method::kTorrentReannounce;
    spec.check = [clock = clock_](Torrent const &torrent)
    {
        if (torrent.get_as<model::TrackerList>("trackers").empty())
        {
            return Admission::reject("Torrent has no trackers: " +
                                     torrent.name());
        }
        if (status_of(torrent) == Status::Stopped)
        {
            return Admission::reject("Not announcing inactive torrent: " +
                                     torrent.name());
        }
        auto const now = clock();
        auto const &allowed =
            torrent.get_as<model::Timestamp>("time-manual-announce-allowed");
        if (allowed.in_future(now))
        {
            return Admission::reject(std::format(
                "Not allowing manual announce until {} (in {}): {}",
                allowed.to_string(now), allowed.delta(now).to_string(),
                torrent.name()));
        }
        return Admission::accept("Announcing: " + torrent.name());
    };
    spec.check_fields = {"status", "trackers", "time-manual-announce-allowed"};
    spec.return_fields = {"trackers"};
    orchestrator_.run(std::move(spec), selector, std::move(callback));
}

void TorrentApi::run_jobs(std::vector<ActionJob> jobs, TorrentsCallback callback)
{
    auto batch = std::make_shared<Batch>();
    batch->jobs = std::move(jobs);
    batch->done = std::move(callback);
    run_next(std::move(batch));
}

void TorrentApi::run_next(std::shared_ptr<Batch> batch)
{
    while (batch->next < batch->jobs.size())
    {
        auto &job = batch->jobs[batch->next++];
        append_messages(batch->merged.messages, job.notes);
        if (!job.spec)
        {
            continue;
        }
        orchestrator_.run(std::move(*job.spec), job.ids,
                          [this, batch](TorrentsResponse response)
                          {
                              auto &merged = batch->merged;
                              merged.success = merged.success || response.success;
                              merged.result.insert(merged.result.end(),
                                                   response.result.begin(),
                                                   response.result.end());
                              append_messages(merged.messages, response.messages);
                              run_next(batch);
                          });
        return;
    }
    auto done = std::move(batch->done);
    auto merged = std::move(batch->merged);
    if (!merged.success)
    {
        merged.result.clear();
    }
    done(std::move(merged));
}

} // namespace tr::client
