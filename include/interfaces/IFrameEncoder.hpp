#pragma once
#include <string>
#include "common/Result.hpp"
#include "common/FrameTypes.hpp"

namespace interfaces {

    class IFrameEncoder {
    public:
        virtual ~IFrameEncoder() = default;

        // Persist Contract:
        // Serializes one frame to 'path' in params.format. Called concurrently
        // from every sink thread, each with its own file names, so
        // implementations must not keep per-call state in members.
        virtual common::EmptyResult persist(
            const common::Frame& frame,
            const std::string& path,
            const common::EncodeParams& params
        ) = 0;
    };

} // namespace interfaces
