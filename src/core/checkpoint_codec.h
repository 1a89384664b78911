/**
 * @file checkpoint_codec.h
 * @brief Checkpoint decoding from an already parsed JSON tree
 */

#ifndef KCENON_TRANSFER_ORCHESTRATOR_SRC_CORE_CHECKPOINT_CODEC_H
#define KCENON_TRANSFER_ORCHESTRATOR_SRC_CORE_CHECKPOINT_CODEC_H

#include "kcenon/transfer_orchestrator/core/checkpoint.h"
#include "json_reader.h"

namespace kcenon::transfer_orchestrator::detail {

// Used when a checkpoint is embedded in a larger document
[[nodiscard]] auto read_checkpoint(const json_value& root) -> result<checkpoint>;

}  // namespace kcenon::transfer_orchestrator::detail

#endif  // KCENON_TRANSFER_ORCHESTRATOR_SRC_CORE_CHECKPOINT_CODEC_H
