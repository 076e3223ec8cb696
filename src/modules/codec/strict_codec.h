// modules/codec/strict_codec.h
#ifndef STAGECRAFT_MODULES_CODEC_STRICT_CODEC_H
#define STAGECRAFT_MODULES_CODEC_STRICT_CODEC_H

#include "core/types/plan.h"
#include <optional>
#include <string>
#include <string_view>

namespace stagecraft {

// Decoders for payloads that crossed a process or machine boundary.
// Each one throws DecodeError when
//   - the payload is not a single well formed JSON value (SYNTAX),
//   - anything but whitespace follows that value (TRAILING_CONTENT),
//   - any object carries a field its schema does not define (UNKNOWN_FIELD),
//   - a field has the wrong JSON type or an unknown enum value (TYPE_MISMATCH),
//   - "version" differs from the wire contract version (VERSION_MISMATCH).
Plan decode_plan_strict(std::string_view payload);

// plan_id_hint only decorates error messages; it never affects the outcome.
HostPlan decode_host_plan_strict(std::string_view payload, const std::string& plan_id_hint = "");

// Best-effort read of a top level "planId" string, for error context before
// a strict decode. Never throws.
std::optional<std::string> peek_plan_id(std::string_view payload) noexcept;

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_CODEC_STRICT_CODEC_H
