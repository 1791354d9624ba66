#include "api/recognition_handler.h"
#include "api/api_error.h"
#include "attendance/attendance_service.h"
#include "core/cors_helper.h"
#include "core/logging_flags.h"
#include "core/logger.h"
#include "storage/face_image_library.h"
#include <chrono>
#include <drogon/HttpResponse.h>
#include <drogon/MultiPart.h>
#include <drogon/utils/Utilities.h>
#include <iomanip>
#include <sstream>

AttendanceService* RecognitionHandler::service_ = nullptr;

void RecognitionHandler::setAttendanceService(AttendanceService* service) {
    service_ = service;
}

HttpResponsePtr RecognitionHandler::createErrorResponse(int statusCode,
                                                        const std::string& error,
                                                        const std::string& message) const {
    Json::Value errorResponse;
    errorResponse["error"] = error;
    if (!message.empty()) {
        errorResponse["message"] = message;
    }

    auto resp = HttpResponse::newHttpJsonResponse(errorResponse);
    resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
    CorsHelper::addAllowAllHeaders(resp);
    return resp;
}

HttpResponsePtr RecognitionHandler::createSuccessResponse(const Json::Value& data,
                                                          int statusCode) const {
    auto resp = HttpResponse::newHttpJsonResponse(data);
    resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
    CorsHelper::addAllowAllHeaders(resp);
    return resp;
}

void RecognitionHandler::handleWithErrors(
    const std::string& route,
    const std::function<HttpResponsePtr()>& operation,
    std::function<void(const HttpResponsePtr &)>& callback) const {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsedMs = [&start_time]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start_time)
            .count();
    };

    if (!service_) {
        callback(createErrorResponse(503, "Service unavailable",
                                     "Attendance service is not initialized"));
        return;
    }

    try {
        auto resp = operation();
        if (isApiLoggingEnabled()) {
            PLOG_INFO << "[API] " << route << " - " << static_cast<int>(resp->statusCode())
                      << " - " << elapsedMs() << "ms";
        }
        callback(resp);
    } catch (const AttendanceError& e) {
        ApiError apiError = ApiError::from(e);
        if (isApiLoggingEnabled()) {
            PLOG_WARNING << "[API] " << route << " - " << apiError.statusCode << " "
                         << e.what() << " - " << elapsedMs() << "ms";
        }
        callback(createErrorResponse(apiError.statusCode, apiError.error, e.what()));
    } catch (const std::exception& e) {
        PLOG_ERROR << "[API] " << route << " - Exception: " << e.what() << " - "
                   << elapsedMs() << "ms";
        callback(createErrorResponse(500, "Internal server error", e.what()));
    } catch (...) {
        PLOG_ERROR << "[API] " << route << " - Unknown exception - " << elapsedMs() << "ms";
        callback(createErrorResponse(500, "Internal server error", "Unknown error occurred"));
    }
}

bool RecognitionHandler::isMultipart(const HttpRequestPtr &req) {
    return req->contentType() == CT_MULTIPART_FORM_DATA ||
           req->getHeader("Content-Type").find("multipart/form-data") != std::string::npos;
}

bool RecognitionHandler::parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

bool RecognitionHandler::validateImageFormatAndSize(const std::vector<unsigned char>& data,
                                                    std::string& extension,
                                                    std::string& error) const {
    if (data.empty()) {
        error = "Image data is empty";
        return false;
    }

    if (data.size() > kMaxImageSize) {
        error = "Image file size exceeds maximum allowed size of 5MB. File size: " +
                std::to_string(data.size() / 1024 / 1024) + "MB";
        return false;
    }

    // JPEG: FF D8, PNG: 89 50 4E 47
    if (data.size() >= 2 && data[0] == 0xFF && data[1] == 0xD8) {
        extension = "jpg";
        return true;
    }
    if (data.size() >= 4 && data[0] == 0x89 && data[1] == 0x50 &&
        data[2] == 0x4E && data[3] == 0x47) {
        extension = "png";
        return true;
    }

    std::stringstream hexBytes;
    hexBytes << std::hex << std::setfill('0');
    size_t bytesToShow = std::min(size_t(8), data.size());
    for (size_t i = 0; i < bytesToShow; i++) {
        hexBytes << std::setw(2) << static_cast<int>(data[i]);
        if (i < bytesToShow - 1) hexBytes << " ";
    }
    error = "Image must be jpg, jpeg, or png. First bytes (hex): " + hexBytes.str();
    return false;
}

bool RecognitionHandler::extractMultipartImage(const HttpRequestPtr &req,
                                               UploadedImage& image,
                                               std::map<std::string, std::string>& fields,
                                               std::string& error) const {
    MultiPartParser parser;
    if (parser.parse(req) != 0) {
        error = "Invalid multipart/form-data body";
        return false;
    }

    for (const auto& [name, value] : parser.getParameters()) {
        fields[name] = value;
    }

    for (const auto& file : parser.getFiles()) {
        std::string field = file.getItemName();
        if (field != "file" && field != "image" && field != "photo") {
            continue;
        }

        image.data.assign(file.fileData(), file.fileData() + file.fileLength());

        std::string detected;
        if (!validateImageFormatAndSize(image.data, detected, error)) {
            return false;
        }

        // Keep the client's extension when it is an accepted one
        image.extension = FaceImageLibrary::normalizeExtension(
            std::string(file.getFileExtension()));
        if (image.extension.empty()) {
            image.extension = detected;
        }

        if (isApiLoggingEnabled()) {
            PLOG_DEBUG << "[RecognitionHandler] Extracted " << image.data.size()
                       << " bytes from multipart field '" << field << "'";
        }
        return true;
    }

    error = "Could not find file field in multipart form data. Expected field name: 'file', 'image', or 'photo'";
    return false;
}

bool RecognitionHandler::extractJsonImage(const Json::Value& json,
                                          UploadedImage& image,
                                          std::string& error) const {
    if (!json.isMember("file") || !json["file"].isString()) {
        error = "Missing required field: file (base64 encoded image)";
        return false;
    }

    std::string fileBase64 = json["file"].asString();

    // Remove data URL prefix if present (e.g., "data:image/jpeg;base64,")
    size_t commaPos = fileBase64.find(',');
    if (commaPos != std::string::npos &&
        fileBase64.substr(0, commaPos).find("base64") != std::string::npos) {
        fileBase64 = fileBase64.substr(commaPos + 1);
    }

    if (fileBase64.empty()) {
        error = "File field is empty";
        return false;
    }

    std::string decoded = drogon::utils::base64Decode(fileBase64);
    image.data.assign(decoded.begin(), decoded.end());
    return validateImageFormatAndSize(image.data, image.extension, error);
}

bool RecognitionHandler::parseEmbedding(const Json::Value& json,
                                        std::vector<float>& embedding,
                                        std::string& error) {
    if (!json.isArray() || json.empty()) {
        error = "Embedding must be a non-empty array of numbers";
        return false;
    }

    embedding.clear();
    embedding.reserve(json.size());
    for (const auto& value : json) {
        if (!value.isNumeric()) {
            error = "Embedding must contain only numbers";
            return false;
        }
        embedding.push_back(value.asFloat());
    }
    return true;
}

bool RecognitionHandler::parseBox(const Json::Value& json, BoundingBox& box, std::string& error) {
    if (!json.isArray() || json.size() != 4) {
        error = "Box must be [top, right, bottom, left]";
        return false;
    }
    for (const auto& value : json) {
        if (!value.isInt()) {
            error = "Box coordinates must be integers";
            return false;
        }
    }

    box.top = json[0].asInt();
    box.right = json[1].asInt();
    box.bottom = json[2].asInt();
    box.left = json[3].asInt();
    return true;
}

void RecognitionHandler::recognize(const HttpRequestPtr &req,
                                   std::function<void(const HttpResponsePtr &)> &&callback) {
    if (isApiLoggingEnabled()) {
        PLOG_INFO << "[API] POST /v1/attendance/recognize - Recognize faces";
        PLOG_DEBUG << "[API] Request from: " << req->getPeerAddr().toIpPort();
    }

    handleWithErrors("POST /v1/attendance/recognize", [&]() -> HttpResponsePtr {
        std::vector<MatchResult> results;
        bool logAttendance = parseBool(req->getParameter("log_attendance"));
        std::string source = req->getParameter("source");
        std::string error;

        if (isMultipart(req)) {
            UploadedImage image;
            std::map<std::string, std::string> fields;
            if (!extractMultipartImage(req, image, fields, error)) {
                return createErrorResponse(400, "Invalid request", error);
            }
            if (fields.count("log_attendance")) {
                logAttendance = parseBool(fields["log_attendance"]);
            }
            if (fields.count("source")) {
                source = fields["source"];
            }
            results = service_->recognizeImage(image.data);
        } else {
            auto json = req->getJsonObject();
            if (!json || !json->isObject()) {
                return createErrorResponse(400, "Invalid request",
                                           "Expected multipart/form-data image or a JSON body");
            }
            if (json->isMember("log_attendance")) {
                if (!(*json)["log_attendance"].isBool()) {
                    return createErrorResponse(400, "Invalid request",
                                               "log_attendance must be a boolean");
                }
                logAttendance = (*json)["log_attendance"].asBool();
            }
            if (json->isMember("source") && (*json)["source"].isString()) {
                source = (*json)["source"].asString();
            }

            if (json->isMember("embeddings")) {
                const Json::Value& list = (*json)["embeddings"];
                if (!list.isArray()) {
                    return createErrorResponse(400, "Invalid request", "embeddings must be an array");
                }

                std::vector<std::vector<float>> embeddings;
                for (const auto& item : list) {
                    std::vector<float> embedding;
                    if (!parseEmbedding(item, embedding, error)) {
                        return createErrorResponse(400, "Invalid request", error);
                    }
                    embeddings.push_back(std::move(embedding));
                }

                if (json->isMember("boxes")) {
                    const Json::Value& boxList = (*json)["boxes"];
                    if (!boxList.isArray()) {
                        return createErrorResponse(400, "Invalid request", "boxes must be an array");
                    }
                    std::vector<BoundingBox> boxes;
                    for (const auto& item : boxList) {
                        BoundingBox box;
                        if (!parseBox(item, box, error)) {
                            return createErrorResponse(400, "Invalid request", error);
                        }
                        boxes.push_back(box);
                    }
                    results = service_->recognizeBatch(embeddings, boxes);
                } else {
                    results = service_->recognizeBatch(embeddings);
                }
            } else if (json->isMember("embedding")) {
                std::vector<float> embedding;
                if (!parseEmbedding((*json)["embedding"], embedding, error)) {
                    return createErrorResponse(400, "Invalid request", error);
                }
                results.push_back(service_->recognize(embedding));
            } else {
                UploadedImage image;
                if (!extractJsonImage(*json, image, error)) {
                    return createErrorResponse(400, "Invalid request", error);
                }
                results = service_->recognizeImage(image.data);
            }
        }

        Json::Value response(Json::objectValue);
        Json::Value resultList(Json::arrayValue);
        for (const auto& result : results) {
            resultList.append(result.toJson());
        }
        response["results"] = resultList;

        if (logAttendance) {
            Json::Value attendance(Json::arrayValue);
            for (const auto& result : results) {
                if (result.isKnown()) {
                    attendance.append(
                        service_->logAttendance(result.identity, source.empty() ? "api" : source)
                            .toJson());
                }
            }
            response["attendance"] = attendance;
        }

        return createSuccessResponse(response);
    }, callback);
}

void RecognitionHandler::enrollFace(const HttpRequestPtr &req,
                                    std::function<void(const HttpResponsePtr &)> &&callback) {
    if (isApiLoggingEnabled()) {
        PLOG_INFO << "[API] POST /v1/attendance/faces - Enroll face";
    }

    handleWithErrors("POST /v1/attendance/faces", [&]() -> HttpResponsePtr {
        std::string userId;
        std::string error;
        Json::Value response(Json::objectValue);

        if (isMultipart(req)) {
            UploadedImage image;
            std::map<std::string, std::string> fields;
            if (!extractMultipartImage(req, image, fields, error)) {
                return createErrorResponse(400, "Invalid request", error);
            }
            userId = AttendanceService::normalizeIdentity(fields["user_id"]);
            service_->enrollImage(userId, image.data, image.extension);
        } else {
            auto json = req->getJsonObject();
            if (!json || !json->isObject()) {
                return createErrorResponse(400, "Invalid request",
                                           "Expected multipart/form-data or a JSON body");
            }
            if (!json->isMember("user_id") || !(*json)["user_id"].isString()) {
                return createErrorResponse(400, "Invalid request", "Missing required field: user_id");
            }
            userId = AttendanceService::normalizeIdentity((*json)["user_id"].asString());

            if (json->isMember("embedding")) {
                std::vector<float> embedding;
                if (!parseEmbedding((*json)["embedding"], embedding, error)) {
                    return createErrorResponse(400, "Invalid request", error);
                }
                service_->enroll(userId, embedding);
            } else {
                UploadedImage image;
                if (!extractJsonImage(*json, image, error)) {
                    return createErrorResponse(400, "Invalid request", error);
                }
                service_->enrollImage(userId, image.data, image.extension);
            }
        }

        response["success"] = true;
        response["user_id"] = userId;
        response["message"] = "Face registered for user '" + userId + "'";
        return createSuccessResponse(response);
    }, callback);
}

void RecognitionHandler::listFaces(const HttpRequestPtr & /*req*/,
                                   std::function<void(const HttpResponsePtr &)> &&callback) {
    if (isApiLoggingEnabled()) {
        PLOG_INFO << "[API] GET /v1/attendance/faces - List enrolled users";
    }

    handleWithErrors("GET /v1/attendance/faces", [&]() -> HttpResponsePtr {
        Json::Value users(Json::arrayValue);
        for (const auto& summary : service_->listIdentities()) {
            users.append(summary.toJson());
        }

        Json::Value response(Json::objectValue);
        response["users"] = users;
        response["total"] = static_cast<int>(users.size());
        return createSuccessResponse(response);
    }, callback);
}

void RecognitionHandler::rebuildEmbeddings(const HttpRequestPtr & /*req*/,
                                           std::function<void(const HttpResponsePtr &)> &&callback) {
    if (isApiLoggingEnabled()) {
        PLOG_INFO << "[API] POST /v1/attendance/embeddings/rebuild - Rebuild embeddings";
    }

    handleWithErrors("POST /v1/attendance/embeddings/rebuild", [&]() -> HttpResponsePtr {
        size_t count = service_->rebuildDatabase();

        Json::Value response(Json::objectValue);
        response["success"] = true;
        response["known_users"] = static_cast<Json::UInt64>(count);
        return createSuccessResponse(response);
    }, callback);
}

void RecognitionHandler::handleOptions(const HttpRequestPtr & /*req*/,
                                       std::function<void(const HttpResponsePtr &)> &&callback) {
    callback(CorsHelper::createOptionsResponse());
}
