#include "config.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include <cstdio>
#include <stdexcept>

namespace {

std::vector<float> ReadFloatArray(const rapidjson::Value& value,
                                  const char* name) {
  if (!value.IsArray())
    throw std::invalid_argument(std::string(name) + " should be an array");
  std::vector<float> result;
  for (auto& item : value.GetArray()) {
    if (!item.IsNumber())
      throw std::invalid_argument(std::string(name) +
                                  " should contain only numbers");
    result.push_back(static_cast<float>(item.GetDouble()));
  }
  return result;
}

std::vector<int32_t> ReadIntArray(const rapidjson::Value& value,
                                  const char* name) {
  if (!value.IsArray())
    throw std::invalid_argument(std::string(name) + " should be an array");
  std::vector<int32_t> result;
  for (auto& item : value.GetArray()) {
    if (!item.IsInt())
      throw std::invalid_argument(std::string(name) +
                                  " should contain only integers");
    result.push_back(item.GetInt());
  }
  return result;
}

const rapidjson::Value& GetMemberObject(const rapidjson::Value& value,
                                        const char* name) {
  const auto& member = value[name];
  if (!member.IsObject())
    throw std::invalid_argument(std::string(name) + " should be an object");
  return member;
}

Config ConfigFromDocument(const rapidjson::Document& doc) {
  if (!doc.IsObject())
    throw std::invalid_argument("Config root should be an object");

  Config config;
  if (doc.HasMember("pyramid_levels")) {
    config.pyramid_levels =
        ReadIntArray(doc["pyramid_levels"], "pyramid_levels");
  }

  if (doc.HasMember("anchor_parameters")) {
    const auto& params = GetMemberObject(doc, "anchor_parameters");
    auto& anchor_params = config.anchor_params;
    if (params.HasMember("sizes"))
      anchor_params.sizes = ReadFloatArray(params["sizes"], "sizes");
    if (params.HasMember("strides"))
      anchor_params.strides = ReadFloatArray(params["strides"], "strides");
    if (params.HasMember("ratios"))
      anchor_params.ratios = ReadFloatArray(params["ratios"], "ratios");
    if (params.HasMember("scales"))
      anchor_params.scales = ReadFloatArray(params["scales"], "scales");
  }

  if (doc.HasMember("regression")) {
    const auto& regression = GetMemberObject(doc, "regression");
    if (regression.HasMember("mean"))
      config.bbox_mean = ReadFloatArray(regression["mean"], "mean");
    if (regression.HasMember("std"))
      config.bbox_std_dev = ReadFloatArray(regression["std"], "std");
  }

  if (doc.HasMember("image_data_format")) {
    const auto& format = doc["image_data_format"];
    if (!format.IsString())
      throw std::invalid_argument("image_data_format should be a string");
    config.image_data_format = ParseImageDataFormat(format.GetString());
  }

  config.Validate();
  return config;
}

void ThrowParseError(const rapidjson::Document& doc,
                     const std::string& source) {
  throw std::runtime_error(source + " parsing error : " +
                           rapidjson::GetParseError_En(doc.GetParseError()) +
                           " at offset " + std::to_string(doc.GetErrorOffset()));
}

}  // namespace

void Config::Validate() const {
  if (pyramid_levels.empty())
    throw std::invalid_argument("Pyramid levels should not be empty");
  for (auto level : pyramid_levels) {
    if (level < 0)
      throw std::invalid_argument("Pyramid levels should not be negative");
  }
  if (anchor_params.sizes.size() != pyramid_levels.size())
    throw std::invalid_argument(
        "Number of anchor sizes should match number of pyramid levels");
  if (anchor_params.strides.size() != pyramid_levels.size())
    throw std::invalid_argument(
        "Number of anchor strides should match number of pyramid levels");
  if (anchor_params.ratios.empty() || anchor_params.scales.empty())
    throw std::invalid_argument("Anchor ratios and scales should not be empty");
  for (auto size : anchor_params.sizes) {
    if (size <= 0)
      throw std::invalid_argument("Anchor sizes should be positive");
  }
  for (auto stride : anchor_params.strides) {
    if (stride <= 0)
      throw std::invalid_argument("Anchor strides should be positive");
  }
  for (auto ratio : anchor_params.ratios) {
    if (ratio <= 0)
      throw std::invalid_argument("Anchor ratios should be positive");
  }
  for (auto scale : anchor_params.scales) {
    if (scale <= 0)
      throw std::invalid_argument("Anchor scales should be positive");
  }
  if (bbox_mean.size() != 4 || bbox_std_dev.size() != 4)
    throw std::invalid_argument(
        "Regression mean and std should have 4 values each");
}

Config ParseConfigJson(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError())
    ThrowParseError(doc, "Config");
  return ConfigFromDocument(doc);
}

Config LoadConfigJson(const std::string& file_name) {
  auto* file = std::fopen(file_name.c_str(), "r");
  if (!file)
    throw std::runtime_error("Failed to open config file " + file_name);

  rapidjson::Document doc;
  {
    char readBuffer[65536];
    rapidjson::FileReadStream is(file, readBuffer, sizeof(readBuffer));
    doc.ParseStream(is);
    std::fclose(file);
  }
  if (doc.HasParseError())
    ThrowParseError(doc, file_name);
  return ConfigFromDocument(doc);
}
