#include "models/Attachment.h"

Attachment Attachment::fromJson(const nlohmann::json &j) {
    Attachment attachment;

    if (j.is_string()) {
        attachment.id = j.get<std::string>();
        return attachment;
    }

    attachment.id = j.at("id").get<std::string>();

    if (j.contains("name") && j["name"].is_string()) {
        attachment.name = j["name"].get<std::string>();
    }
    if (j.contains("extension") && j["extension"].is_string()) {
        attachment.extension = j["extension"].get<std::string>();
    }
    if (j.contains("mime_type") && j["mime_type"].is_string()) {
        attachment.mimeType = j["mime_type"].get<std::string>();
    }
    if (j.contains("size") && j["size"].is_number_integer() && j["size"].get<int64_t>() >= 0) {
        attachment.size = j["size"].get<uint64_t>();
    }
    if (j.contains("width") && j["width"].is_number_integer()) {
        attachment.width = j["width"].get<int>();
    }
    if (j.contains("height") && j["height"].is_number_integer()) {
        attachment.height = j["height"].get<int>();
    }

    return attachment;
}

bool Attachment::isImage() const { return mimeType.rfind("image/", 0) == 0; }

bool Attachment::isVideo() const { return mimeType.rfind("video/", 0) == 0; }
