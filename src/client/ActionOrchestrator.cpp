#include "client/ActionOrchestrator.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace tr::client
{

namespace
{

std::vector<std::string> with_identity(std::vector<std::string> keys)
{
    for (char const *key : {"id", "name"})
    {
        if (std::find(keys.begin(), keys.end(), key) == keys.end())
        {
            keys.emplace_back(key);
        }
    }
    return keys;
}

} // namespace

ActionOrchestrator::ActionOrchestrator(RequestCoordinator &coordinator)
    : coordinator_(coordinator)
{
}

void ActionOrchestrator::run(ActionSpec spec, Selector const &selector,
                             TorrentsCallback callback)
{
    auto check_keys = with_identity(spec.check_fields);
    coordinator_.resolve(
        selector, std::move(check_keys),
        [this, spec = std::move(spec),
         callback = std::move(callback)](TorrentsResponse selected) mutable
        {
            if (!selected.success)
            {
                callback(TorrentsResponse::failed(std::move(selected.messages)));
                return;
            }
            auto messages = std::move(selected.messages);
            std::vector<int> admitted;
            for (auto const &torrent : selected.result)
            {
                if (!spec.check)
                {
                    admitted.push_back(torrent->id());
                    continue;
                }
                auto admission = spec.check(*torrent);
                if (admission.admit)
                {
                    admitted.push_back(torrent->id());
                }
                if (admission.message)
                {
                    messages.push_back(
                        admission.admit
                            ? Message::info(std::move(*admission.message))
                            : Message::error(std::move(*admission.message)));
                }
            }
            if (admitted.empty())
            {
                callback(TorrentsResponse::failed(std::move(messages)));
                return;
            }
            mutate(std::move(spec), std::move(admitted), std::move(messages),
                   std::move(callback));
        });
}

void ActionOrchestrator::mutate(ActionSpec spec, std::vector<int> admitted,
                                Messages messages, TorrentsCallback callback)
{
    auto arguments = json::MutableDocument::object();
    auto *doc = arguments.doc();
    auto *root = arguments.root();
    yyjson_mut_obj_add_val(doc, root, "ids", json::int_array(doc, admitted));
    if (spec.arguments)
    {
        spec.arguments(doc, root);
    }
    TR_LOG_INFO("{} on {} torrent(s)", spec.method, admitted.size());

    auto return_keys = with_identity(std::move(spec.return_fields));
    coordinator_.transport().call(
        spec.method, std::move(arguments),
        [this, admitted = std::move(admitted), messages = std::move(messages),
         return_keys = std::move(return_keys), method = spec.method,
         callback = std::move(callback)](RpcReply reply) mutable
        {
            if (!reply.ok())
            {
                TR_LOG_WARN("{} failed: {}", method, *reply.error);
                messages.push_back(Message::error(*reply.error));
                callback(TorrentsResponse::failed(std::move(messages)));
                return;
            }
            coordinator_.get_by_ids(
                std::move(return_keys), std::move(admitted),
                [messages = std::move(messages),
                 callback = std::move(callback)](
                    TorrentsResponse refetched) mutable
                {
                    if (!refetched.success)
                    {
                        append_messages(messages, refetched.messages);
                        callback(TorrentsResponse::failed(std::move(messages)));
                        return;
                    }
                    TorrentsResponse response;
                    response.success = true;
                    response.result = std::move(refetched.result);
                    response.messages = std::move(messages);
                    append_messages(response.messages, refetched.messages);
                    callback(std::move(response));
                });
        });
}

} // namespace tr::client
