#pragma once

#include "client/RequestCoordinator.hpp"
#include "client/Response.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tr::client
{

struct Admission
{
    bool admit = false;
    std::optional<std::string> message;

    static Admission accept(std::string message)
    {
        return Admission{true, std::move(message)};
    }
    static Admission reject(std::string message)
    {
        return Admission{false, std::move(message)};
    }
};

using AdmissionCheck = std::function<Admission(model::Torrent const &)>;

// Adds the fixed arguments of a mutating call to the request object.
using ArgumentWriter = std::function<void(yyjson_mut_doc *, yyjson_mut_val *)>;

struct ActionSpec
{
    char const *method = nullptr;
    ArgumentWriter arguments;
    // Absent: every selected torrent is admitted.
    AdmissionCheck check;
    std::vector<std::string> check_fields;
    std::vector<std::string> return_fields;
};

// select -> check -> one batched mutation -> refetch. Every mutating
// operation goes through run().
class ActionOrchestrator
{
  public:
    explicit ActionOrchestrator(RequestCoordinator &coordinator);

    void run(ActionSpec spec, Selector const &selector,
             TorrentsCallback callback);

    RequestCoordinator &coordinator() noexcept { return coordinator_; }

  private:
    void mutate(ActionSpec spec, std::vector<int> admitted, Messages messages,
                TorrentsCallback callback);

    RequestCoordinator &coordinator_;
};

} // namespace tr::client
