#include "config/ConfigReader.h"
#include "logger/Logger.h"
#include <fstream>
#include <sstream>

namespace config
{

bool ConfigReader::readFromFile(const std::string& fileName)
{
    logger::info("reading config file %s", "ConfigReader", fileName.c_str());
    std::ifstream configFile(fileName);
    if (!configFile.is_open())
    {
        logger::error("failed to open config file %s", "ConfigReader", fileName.c_str());
        return false;
    }

    std::stringstream content;
    content << configFile.rdbuf();
    return parse(content.str());
}

bool ConfigReader::readFromString(const std::string& json)
{
    return parse(json);
}

bool ConfigReader::parse(const std::string& json)
{
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(json);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        logger::error("config is not valid JSON: %s", "ConfigReader", e.what());
        return false;
    }

    if (!document.is_object())
    {
        logger::error("config must be a JSON object", "ConfigReader");
        return false;
    }

    bool result = true;
    for (auto* property : _properties)
    {
        try
        {
            if (!property->read(document))
            {
                logger::error("mandatory config key %s is missing", "ConfigReader", property->getName().c_str());
                result = false;
            }
        }
        catch (const nlohmann::json::exception& e)
        {
            logger::error("config key %s has wrong type: %s", "ConfigReader", property->getName().c_str(), e.what());
            result = false;
        }
    }

    return result && validate();
}

std::string ConfigReader::dump() const
{
    nlohmann::json document = nlohmann::json::object();
    for (const auto* property : _properties)
    {
        property->write(document);
    }
    return document.dump();
}

} // namespace config
