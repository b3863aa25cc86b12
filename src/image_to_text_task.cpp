#include "anticaptcha/image_to_text_task.hpp"

namespace anticaptcha {

namespace {

template <typename T>
std::optional<T> optionalField(const nlohmann::json& params, const char* field) {
    auto it = params.find(field);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

ImageToTextOptions ImageToTextOptions::fromJson(const nlohmann::json& params) {
    ImageToTextOptions options;
    options.phrase = optionalField<bool>(params, "phrase");
    options.caseSensitive = optionalField<bool>(params, "case");
    options.numeric = optionalField<int>(params, "numeric");
    options.math = optionalField<bool>(params, "math");
    options.minLength = optionalField<int>(params, "minLength");
    options.maxLength = optionalField<int>(params, "maxLength");
    options.comment = optionalField<std::string>(params, "comment");
    options.websiteURL = optionalField<std::string>(params, "websiteURL");
    return options;
}

ImageToTextTask::ImageToTextTask(std::string imageData, ImageToTextOptions options)
    : body(std::move(imageData)), options(std::move(options)) {}

nlohmann::json ImageToTextTask::preparePayload() const {
    nlohmann::json payload{{"type", type()}, {"body", body}};

    if (options.phrase) payload["phrase"] = *options.phrase;
    if (options.caseSensitive) payload["case"] = *options.caseSensitive;
    if (options.numeric) payload["numeric"] = *options.numeric;
    if (options.math) payload["math"] = *options.math;
    if (options.minLength) payload["minLength"] = *options.minLength;
    if (options.maxLength) payload["maxLength"] = *options.maxLength;
    if (options.comment) payload["comment"] = *options.comment;
    if (options.websiteURL) payload["websiteURL"] = *options.websiteURL;

    return payload;
}

} // namespace anticaptcha
