/**
 * @file persistence.cpp
 * @brief JSON crop documents via nlohmann::json
 */

#include "keycrop/persistence.hpp"

#include <fstream>
#include <memory>
#include <sstream>

#include "keycrop/logging.hpp"
#include "keycrop/mask_codec.hpp"

namespace keycrop {

using json = nlohmann::json;

bool operator==(const CropDocument &a, const CropDocument &b) {
  return a.timeline == b.timeline && a.settings == b.settings;
}

// **----- Geometry -----**

namespace {

json rect_to_json(const NormalizedRect &r) {
  return {{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

NormalizedRect rect_from_json(const json &j) {
  NormalizedRect r;
  r.x = j.at("x").get<double>();
  r.y = j.at("y").get<double>();
  r.width = j.at("width").get<double>();
  r.height = j.at("height").get<double>();
  return r;
}

json geometry_to_json(const CropGeometry &g) {
  switch (mode_of(g)) {
  case CropMode::Rectangle:
    return rect_to_json(std::get<RectangleCrop>(g).rect);
  case CropMode::Circle: {
    const auto &c = std::get<CircleCrop>(g);
    return {{"centerX", c.center.x},
            {"centerY", c.center.y},
            {"radius", c.radius}};
  }
  case CropMode::Freehand: {
    json vertices = json::array();
    for (const auto &v : std::get<FreehandCrop>(g).vertices)
      vertices.push_back(json{{"x", v.x}, {"y", v.y}});
    return {{"vertices", vertices}};
  }
  case CropMode::AI: {
    const auto &ai = std::get<AICrop>(g);
    json j = {{"boundingBox", rect_to_json(ai.bounding_box)}};
    if (ai.mask)
      j["mask"] = mask_to_json(*ai.mask);
    return j;
  }
  }
  return json::object();
}

/// Throws nlohmann::json::exception on missing keys or wrong types
ErrorCode geometry_from_json(CropMode mode, const json &j, CropGeometry &out) {
  switch (mode) {
  case CropMode::Rectangle:
    out = RectangleCrop{rect_from_json(j)};
    return ErrorCode::Ok;
  case CropMode::Circle: {
    CircleCrop c;
    c.center.x = j.at("centerX").get<double>();
    c.center.y = j.at("centerY").get<double>();
    c.radius = j.at("radius").get<double>();
    out = c;
    return ErrorCode::Ok;
  }
  case CropMode::Freehand: {
    FreehandCrop f;
    for (const auto &v : j.at("vertices"))
      f.vertices.push_back({v.at("x").get<double>(), v.at("y").get<double>()});
    out = std::move(f);
    return ErrorCode::Ok;
  }
  case CropMode::AI: {
    AICrop ai;
    ai.bounding_box = rect_from_json(j.at("boundingBox"));
    if (j.contains("mask") && !j["mask"].is_null()) {
      auto mask = std::make_shared<RenderedMask>();
      ErrorCode err = mask_from_json(j["mask"], *mask);
      if (!ok(err))
        return err;
      ai.mask = std::move(mask);
    }
    out = std::move(ai);
    return ErrorCode::Ok;
  }
  }
  return ErrorCode::InvalidInput;
}

} // anonymous namespace

// **----- Masks -----**

json mask_to_json(const RenderedMask &mask) {
  return {{"size", {mask.pixel_height, mask.pixel_width}},
          {"counts", encode_coco_counts(mask)}};
}

ErrorCode mask_from_json(const json &j, RenderedMask &out) {
  try {
    const json &size = j.at("size");
    if (!size.is_array() || size.size() < 2)
      return ErrorCode::InvalidInput;
    int height = size[0].get<int>();
    int width = size[1].get<int>();

    const json &counts = j.at("counts");
    if (counts.is_string())
      return decode_rle_string(counts.get<std::string>(), width, height, out);
    if (counts.is_array())
      return decode_coco_counts(counts.get<std::vector<int64_t>>(), width,
                                height, out);
    return ErrorCode::InvalidInput;
  } catch (const json::exception &e) {
    LOG_ERROR("Malformed mask object: {}", e.what());
    return ErrorCode::InvalidInput;
  }
}

// **----- Documents -----**

json document_to_json(const CropDocument &doc) {
  const CropTimeline &tl = doc.timeline;
  const char *geometry_key = mode_name(tl.mode());

  json keyframes = json::array();
  for (const auto &kf : tl.keyframes()) {
    keyframes.push_back(json{{"timestamp", kf.timestamp},
                             {"interpolation", easing_name(kf.easing)},
                             {geometry_key, geometry_to_json(kf.geometry)}});
  }

  json crop = {{"mode", geometry_key}, {"keyframes", keyframes}};
  if (tl.duration() > 0.0)
    crop["duration"] = tl.duration();

  return {{"version", DOCUMENT_VERSION},
          {"crop", crop},
          {"export",
           {{"preserveFullFrame", doc.settings.preserve_full_frame},
            {"enableAlpha", doc.settings.enable_alpha},
            {"codec", codec_hint_name(doc.settings.codec_hint)},
            {"useHardwareEncoder", doc.settings.use_hardware_encoder}}}};
}

ErrorCode document_from_json(const json &j, CropDocument &out) {
  try {
    std::string version = j.value("version", std::string(DOCUMENT_VERSION));
    if (version != DOCUMENT_VERSION)
      LOG_WARN("Crop document version {} (expected {})", version,
               DOCUMENT_VERSION);

    const json &crop = j.at("crop");
    CropMode mode;
    if (!parse_mode(crop.at("mode").get<std::string>(), mode)) {
      LOG_ERROR("Unknown crop mode: {}", crop.at("mode").dump());
      return ErrorCode::InvalidInput;
    }

    CropTimeline timeline(mode, crop.value("duration", 0.0));
    for (const auto &k : crop.value("keyframes", json::array())) {
      Keyframe kf;
      kf.timestamp = k.at("timestamp").get<double>();
      std::string easing = k.value("interpolation", std::string("linear"));
      if (!parse_easing(easing, kf.easing)) {
        LOG_ERROR("Unknown interpolation: {}", easing);
        return ErrorCode::InvalidInput;
      }
      ErrorCode err =
          geometry_from_json(mode, k.at(mode_name(mode)), kf.geometry);
      if (!ok(err))
        return err;
      err = timeline.add_keyframe(kf);
      if (!ok(err)) {
        LOG_ERROR("Rejected keyframe at {:.3f}s: {}", kf.timestamp,
                  error_name(err));
        return err;
      }
    }

    ExportSettings settings;
    if (j.contains("export")) {
      const json &ex = j["export"];
      settings.preserve_full_frame = ex.value("preserveFullFrame", false);
      settings.enable_alpha = ex.value("enableAlpha", false);
      settings.use_hardware_encoder = ex.value("useHardwareEncoder", false);
      std::string codec = ex.value("codec", std::string("source"));
      if (!parse_codec_hint(codec, settings.codec_hint)) {
        LOG_ERROR("Unknown codec: {}", codec);
        return ErrorCode::InvalidInput;
      }
    }

    out.timeline = std::move(timeline);
    out.settings = settings;
    return ErrorCode::Ok;
  } catch (const json::exception &e) {
    LOG_ERROR("Malformed crop document: {}", e.what());
    return ErrorCode::InvalidInput;
  }
}

std::string serialize_document(const CropDocument &doc) {
  return document_to_json(doc).dump(2);
}

ErrorCode parse_document(const std::string &text, CropDocument &out) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    LOG_ERROR("Crop document is not valid JSON");
    return ErrorCode::InvalidInput;
  }
  return document_from_json(j, out);
}

namespace {

ErrorCode read_text(const std::string &path, std::string &text) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Cannot open {}", path);
    return ErrorCode::IoError;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  text = ss.str();
  return ErrorCode::Ok;
}

} // anonymous namespace

ErrorCode save_document(const CropDocument &doc, const std::string &path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    LOG_ERROR("Cannot write {}", path);
    return ErrorCode::IoError;
  }
  out << serialize_document(doc) << '\n';
  out.flush();
  if (!out) {
    LOG_ERROR("Short write on {}", path);
    return ErrorCode::IoError;
  }
  return ErrorCode::Ok;
}

ErrorCode load_document(const std::string &path, CropDocument &out) {
  std::string text;
  ErrorCode err = read_text(path, text);
  if (!ok(err))
    return err;
  return parse_document(text, out);
}

// **----- Tracking results -----**

ErrorCode load_tracking_file(const std::string &path,
                             std::vector<TrackedFrame> &frames) {
  std::string text;
  ErrorCode err = read_text(path, text);
  if (!ok(err))
    return err;

  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    LOG_ERROR("Tracking file is not valid JSON: {}", path);
    return ErrorCode::InvalidInput;
  }

  try {
    std::vector<TrackedFrame> parsed;
    for (const auto &f : j.at("frames")) {
      TrackedFrame tf;
      tf.timestamp = f.at("timestamp").get<double>();
      tf.bounding_box = rect_from_json(f.at("boundingBox"));
      if (f.contains("mask") && !f["mask"].is_null()) {
        auto mask = std::make_shared<RenderedMask>();
        err = mask_from_json(f["mask"], *mask);
        if (!ok(err))
          return err;
        tf.mask = std::move(mask);
      }
      parsed.push_back(std::move(tf));
    }
    frames = std::move(parsed);
    return ErrorCode::Ok;
  } catch (const json::exception &e) {
    LOG_ERROR("Malformed tracking file {}: {}", path, e.what());
    return ErrorCode::InvalidInput;
  }
}

} // namespace keycrop
