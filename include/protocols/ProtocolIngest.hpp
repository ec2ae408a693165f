#pragma once
/** @file  ProtocolIngest.hpp
 *  @brief Validates raw ABF annotations and builds a ProtocolDescriptor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

#include "protocols/ProtocolDescriptor.hpp"

namespace axostim::protocols {

  /**
 * @brief Pure transform from the file reader's annotation schema to the typed model.
 *
 * @param protocol        `protocol` annotation: lRunsPerTrial, lEpisodesPerRun,
 *                        nAlternateDACOutputState, nAlternateDigitalOutputState,
 *                        nDigitalDACChannel, nDigitalTrainActiveLogic, and the
 *                        optional lNumSamplesPerEpisode, fADCSequenceInterval,
 *                        fDACHoldingLevel[].
 * @param epochInfo       `EpochInfo`: array of per-epoch digital records.
 * @param epochInfoPerDac `dictEpochInfoPerDAC`: DAC number -> epoch number -> record.
 *
 * Throws core::MalformedProtocol (or core::UnrecognizedEpochType) on any violation;
 * never returns a partially valid descriptor.
 */
  ProtocolDescriptor ingest(const nlohmann::json& protocol, const nlohmann::json& epochInfo,
                            const nlohmann::json& epochInfoPerDac);

  /// As above, plus a second per-DAC waveform set played on alternate sweeps.
  ProtocolDescriptor ingest(const nlohmann::json& protocol, const nlohmann::json& epochInfo,
                            const nlohmann::json& epochInfoPerDac,
                            const nlohmann::json& alternateEpochInfoPerDac);

} // namespace axostim::protocols
