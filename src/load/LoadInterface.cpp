#include "qlink/load/LoadInterface.hpp"

#include "qlink/protocol/QLinkConfig.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <utility>

namespace qlink::load {

namespace config = protocol::config;

Result<int> LoadInterface::getLevel(const Param& contractorNumber) {
    // VGL <contractor_number>
    // -> R:GVL <level>
    auto response = invoke("VGL", {contractorNumber});
    if (!response) {
        return unexpected(response.error());
    }
    if (response->args.empty()) {
        return unexpected(Error::malformed("VGL reply carried no level"));
    }

    // The level is the last argument whether or not the reply echoes the id.
    const std::string& text = response->args.back();
    int level = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, level);
    if (ec != std::errc{} || ptr != end) {
        return unexpected(Error::malformed("VGL reply level \"" + text + "\" is not an integer"));
    }
    return level;
}

Result<void> LoadInterface::setLevel(const Param& contractorNumber, int level) {
    return ramp(contractorNumber, level, 0.0);
}

Result<void> LoadInterface::ramp(const Param& contractorNumber, int level, double seconds) {
    level = std::clamp(level, config::LEVEL_MIN, config::LEVEL_MAX);

    // VLO <contractor_number> <level> <fade>
    auto response = invoke("VLO", {contractorNumber, level, seconds});
    if (!response) {
        return unexpected(response.error());
    }
    return {};
}

Result<void> LoadInterface::turnOn(const Param& contractorNumber,
                                   std::optional<double> transition,
                                   std::optional<int> level) {
    const int target = level.value_or(config::LEVEL_MAX);
    if (!transition) {
        return setLevel(contractorNumber, target);
    }
    return ramp(contractorNumber, target, *transition);
}

Result<void> LoadInterface::turnOff(const Param& contractorNumber,
                                    std::optional<double> transition) {
    if (!transition) {
        return setLevel(contractorNumber, config::LEVEL_MIN);
    }
    return ramp(contractorNumber, config::LEVEL_MIN, *transition);
}

Result<protocol::CommandResponse>
LoadInterface::invoke(std::string_view command, std::vector<Param> params) {
    return session.sendCommand(command, params);
}

} // namespace qlink::load
