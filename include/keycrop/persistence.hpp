/**
 * @file persistence.hpp
 * @brief Crop document schema (JSON) and tracking-result files
 *
 * @details Document layout (version "2.0"):
 *
 *   { "version": "2.0",
 *     "crop":   { "mode": "...", "duration": s, "keyframes": [...] },
 *     "export": { "preserveFullFrame": b, "enableAlpha": b,
 *                 "codec": "...", "useHardwareEncoder": b } }
 *
 *          Each keyframe carries "timestamp", "interpolation" and exactly
 *          one geometry object named after the mode. AI masks are stored as
 *          COCO integer RLE {"size": [h, w], "counts": [...]}.
 *
 * @note Loading replays every keyframe through CropTimeline::add_keyframe,
 *       so a document that violates a timeline invariant is rejected with
 *       the same error the mutation API would return.
 */

#ifndef KEYCROP_PERSISTENCE_HPP
#define KEYCROP_PERSISTENCE_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ai_tracking.hpp"
#include "error.hpp"
#include "timeline.hpp"
#include "types.hpp"

namespace keycrop {

constexpr const char *DOCUMENT_VERSION = "2.0";

/**
 * @struct CropDocument
 * @brief Everything stored per video.
 */
struct CropDocument {
  CropTimeline timeline;
  ExportSettings settings;
};

bool operator==(const CropDocument &a, const CropDocument &b);

// **---- Masks ----**

nlohmann::json mask_to_json(const RenderedMask &mask);

/**
 * @brief Decode {"size": [h, w], "counts": ...}.
 * @note counts may be an integer array (COCO) or a string (pair RLE or
 *       COCO compressed).
 */
ErrorCode mask_from_json(const nlohmann::json &j, RenderedMask &out);

// **---- Documents ----**

nlohmann::json document_to_json(const CropDocument &doc);
ErrorCode document_from_json(const nlohmann::json &j, CropDocument &out);

std::string serialize_document(const CropDocument &doc);
ErrorCode parse_document(const std::string &text, CropDocument &out);

/// Write a document; IoError when the file cannot be written
ErrorCode save_document(const CropDocument &doc, const std::string &path);

/// Read a document; IoError (unreadable) or InvalidInput (malformed)
ErrorCode load_document(const std::string &path, CropDocument &out);

// **---- Tracking results ----**

/**
 * @brief Read tracking output saved by the segmentation service.
 * @note Layout: {"frames": [{"timestamp", "boundingBox", "mask"?}, ...]}
 */
ErrorCode load_tracking_file(const std::string &path,
                             std::vector<TrackedFrame> &frames);

} // namespace keycrop

#endif // KEYCROP_PERSISTENCE_HPP
