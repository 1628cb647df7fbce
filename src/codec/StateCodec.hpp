//
// StateCodec.hpp
//

#ifndef RUMMIKUB_STATECODEC_HPP
#define RUMMIKUB_STATECODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/State.hpp"

#include "generated/flatbuffers/rummikub_state_generated.h"

namespace rummikub::core::codec
{
    struct ParseError
    {
        std::string message;
    };

    auto ToFbColor(Color c) noexcept -> rummikub::gen::state::Color;
    // nullopt for values outside the schema enum
    auto FromFbColor(rummikub::gen::state::Color c) noexcept -> std::optional<Color>;

    auto EncodeGameRecord(GameRecord const& rec) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer and rebuilds tiles with their original ids.
    // Malformed tiles, repeated ids and inconsistent seats are ParseErrors.
    auto DecodeGameRecord(std::span<std::byte const> bytes)
        -> std::expected<GameRecord, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace rummikub::core::codec

#endif //RUMMIKUB_STATECODEC_HPP
