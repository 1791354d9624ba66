#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <map>
#include <string>
#include <vector>

using namespace drogon;

class AttendanceService;
struct BoundingBox;

/**
 * @brief Face Recognition Handler
 *
 * Recognition and enrollment on top of AttendanceService.
 *
 * Endpoints:
 * - POST /v1/attendance/recognize - Recognize faces in an image or in embeddings
 * - POST /v1/attendance/faces - Enroll a user from an image or an embedding
 * - GET /v1/attendance/faces - List enrolled users
 * - POST /v1/attendance/embeddings/rebuild - Rebuild embeddings from stored images
 *
 * Images are accepted as multipart/form-data (field "file", "image" or
 * "photo") or as base64 in a JSON body ("file", data URL prefix allowed).
 */
class RecognitionHandler : public drogon::HttpController<RecognitionHandler> {
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(RecognitionHandler::recognize, "/v1/attendance/recognize", Post);
        ADD_METHOD_TO(RecognitionHandler::enrollFace, "/v1/attendance/faces", Post);
        ADD_METHOD_TO(RecognitionHandler::listFaces, "/v1/attendance/faces", Get);
        ADD_METHOD_TO(RecognitionHandler::rebuildEmbeddings, "/v1/attendance/embeddings/rebuild", Post);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/attendance/recognize", Options);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/attendance/faces", Options);
        ADD_METHOD_TO(RecognitionHandler::handleOptions, "/v1/attendance/embeddings/rebuild", Options);
    METHOD_LIST_END

    /**
     * @brief Handle POST /v1/attendance/recognize
     *
     * Body: image (multipart or {"file": base64}), or
     * {"embedding": [...]} / {"embeddings": [[...], ...], "boxes": [[t, r, b, l], ...]}.
     * With log_attendance=true (query or JSON) every known face is also
     * logged to the attendance ledger.
     */
    void recognize(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/attendance/faces
     *
     * Body: user_id + image (multipart or {"user_id", "file"}), or
     * {"user_id", "embedding": [...]}
     */
    void enrollFace(const HttpRequestPtr &req,
                    std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle GET /v1/attendance/faces
     */
    void listFaces(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle POST /v1/attendance/embeddings/rebuild
     */
    void rebuildEmbeddings(const HttpRequestPtr &req,
                           std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Handle OPTIONS request for CORS preflight
     */
    void handleOptions(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Set attendance service (dependency injection)
     */
    static void setAttendanceService(AttendanceService* service);

    /**
     * @brief Maximum accepted image size
     */
    static constexpr size_t kMaxImageSize = 5 * 1024 * 1024;

private:
    static AttendanceService* service_;

    struct UploadedImage {
        std::vector<unsigned char> data;
        std::string extension; // jpg, jpeg or png
    };

    /**
     * @brief Extract image and plain form fields from a multipart request
     */
    bool extractMultipartImage(const HttpRequestPtr &req,
                               UploadedImage& image,
                               std::map<std::string, std::string>& fields,
                               std::string& error) const;

    /**
     * @brief Extract image from JSON "file" (base64)
     */
    bool extractJsonImage(const Json::Value& json,
                          UploadedImage& image,
                          std::string& error) const;

    /**
     * @brief Check size limit and magic bytes (JPEG or PNG)
     * @param extension Detected extension on success
     */
    bool validateImageFormatAndSize(const std::vector<unsigned char>& data,
                                    std::string& extension,
                                    std::string& error) const;

    static bool isMultipart(const HttpRequestPtr &req);
    static bool parseEmbedding(const Json::Value& json,
                               std::vector<float>& embedding,
                               std::string& error);
    static bool parseBox(const Json::Value& json, BoundingBox& box, std::string& error);
    static bool parseBool(const std::string& value);

    /**
     * @brief Create error response
     */
    HttpResponsePtr createErrorResponse(int statusCode,
                                        const std::string& error,
                                        const std::string& message = "") const;

    /**
     * @brief Create success JSON response with CORS headers
     */
    HttpResponsePtr createSuccessResponse(const Json::Value& data, int statusCode = 200) const;

    /**
     * @brief Run an operation and translate service errors into responses
     */
    void handleWithErrors(const std::string& route,
                          const std::function<HttpResponsePtr()>& operation,
                          std::function<void(const HttpResponsePtr &)>& callback) const;
};
