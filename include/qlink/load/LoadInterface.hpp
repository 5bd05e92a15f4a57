#pragma once
#include "qlink/core/Error.hpp"
#include "qlink/protocol/CommandSession.hpp"
#include "qlink/protocol/WireCodec.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace qlink::load {

using protocol::Param;

/**
 * @brief Typed operations on loads (lights, motorised covers) addressed by contractor number.
 *
 * Levels are percentages 0-100. Each call is one session exchange and every
 * failure is returned exactly as the session reported it.
 */
class LoadInterface {
public:
    explicit LoadInterface(protocol::CommandSession& session) : session(session) {}

    /// Query the current level (`VGL <id>`).
    Result<int> getLevel(const Param& contractorNumber);

    /// Jump straight to @p level. Same as ramp() with a zero fade.
    Result<void> setLevel(const Param& contractorNumber, int level);

    /**
     * @brief Fade to @p level over @p seconds (`VLO <id> <level> <seconds>`).
     *
     * @p level is clamped to 0-100 before it is sent.
     */
    Result<void> ramp(const Param& contractorNumber, int level = 0, double seconds = 0.0);

    // Not part of the controller's command set.
    Result<void> turnOn(const Param& contractorNumber,
                        std::optional<double> transition = std::nullopt,
                        std::optional<int> level = std::nullopt);
    Result<void> turnOff(const Param& contractorNumber,
                         std::optional<double> transition = std::nullopt);

private:
    Result<protocol::CommandResponse> invoke(std::string_view command, std::vector<Param> params);

    protocol::CommandSession& session;
};

} // namespace qlink::load
