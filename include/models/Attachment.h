#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief Represents a file attached to a message
 */
class Attachment {
  public:
    /**
     * @brief Deserialize attachment from a file info JSON object
     * @param j JSON object from the server
     * @return Attachment instance
     */
    static Attachment fromJson(const nlohmann::json &j);

    /**
     * @brief Check if attachment is an image
     * @return true if the MIME type is image/*
     */
    bool isImage() const;

    /**
     * @brief Check if attachment is a video
     * @return true if the MIME type is video/*
     */
    bool isVideo() const;

    std::string id;             ///< File ID
    std::string name;           ///< Original filename
    std::string extension;      ///< Extension without the dot
    std::string mimeType;       ///< MIME type (e.g., "image/png")
    uint64_t size = 0;          ///< File size in bytes
    std::optional<int> width;   ///< Image/video width in pixels
    std::optional<int> height;  ///< Image/video height in pixels
};
