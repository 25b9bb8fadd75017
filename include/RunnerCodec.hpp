#pragma once

#include "Grid.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace trafficjam
{
    class Runner;

    static constexpr const char *RUN_ARTIFACT_FORMAT = "trafficjam-run";
    static constexpr unsigned RUN_ARTIFACT_VERSION = 1;
    static constexpr const char *HISTORY_ENCODING = "zlib-u8";

    // CBOR document holding the street parameters, the rule descriptors and
    // the zlib-compressed history (time x lane x cell). The live grid is not
    // stored; decoding re-derives it from the seed.
    std::vector<uint8_t> encodeRunArtifact(const Runner &runner);

    // Throws SimulationError with CorruptArtifact or VersionMismatch.
    Runner decodeRunArtifact(const std::vector<uint8_t> &bytes);

    std::vector<uint8_t> compressHistory(const std::vector<Grid> &history);
    std::vector<Grid> decompressHistory(const std::vector<uint8_t> &data,
                                        std::size_t steps,
                                        std::size_t lanes,
                                        std::size_t length);

    bool writeArtifactFile(const std::string &path, const std::vector<uint8_t> &bytes, std::string *error = nullptr);
    bool readArtifactFile(const std::string &path, std::vector<uint8_t> &bytes, std::string *error = nullptr);

} // namespace trafficjam
