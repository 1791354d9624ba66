#include "models/face_match.h"

Json::Value BoundingBox::toJson() const {
  Json::Value json(Json::arrayValue);
  json.append(top);
  json.append(right);
  json.append(bottom);
  json.append(left);
  return json;
}

Json::Value MatchResult::toJson() const {
  Json::Value json(Json::objectValue);
  json["user_id"] = identity;
  json["distance"] = distance;
  if (box) {
    json["bbox"] = box->toJson();
  } else {
    json["bbox"] = Json::Value(Json::nullValue);
  }
  return json;
}

Json::Value IdentitySummary::toJson() const {
  Json::Value json(Json::objectValue);
  json["user_id"] = identity;
  json["photo_count"] = photoCount;
  json["has_embedding"] = hasEmbedding;
  return json;
}
