#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace config
{

/*
Declare config properties as members and read them from a flat JSON object where grouped properties use dotted
keys, e.g. "activity.decayIntervalMs".

class RosterConfig : public ConfigReader
{
public:
    CFG_PROP(uint32_t, fetchLimit, 100);
    CFG_GROUP()
    CFG_PROP(uint32_t, decayIntervalMs, 10000);
    CFG_GROUP_END(activity);
};

Properties register themselves with the reader on construction, so a reader must not be copied.
*/
class ConfigReader
{
public:
    ConfigReader() = default;
    virtual ~ConfigReader() = default;
    ConfigReader(const ConfigReader&) = delete;
    ConfigReader& operator=(const ConfigReader&) = delete;

    // false if the file is unreadable, the JSON is broken, a mandatory key is missing or validation fails
    bool readFromFile(const std::string& fileName);
    bool readFromString(const std::string& json);

    // effective values of all properties as a flat JSON object
    std::string dump() const;

protected:
    // Cross property checks, run after a successful read. Log the reason when returning false.
    virtual bool validate() const { return true; }

    struct IProperty
    {
        virtual ~IProperty() = default;
        virtual bool read(const nlohmann::json& document) = 0;
        virtual void write(nlohmann::json& document) const = 0;
        virtual const std::string& getName() const = 0;
    };

    template <typename T>
    class PropertyImpl : public IProperty
    {
    public:
        PropertyImpl(const char* name,
            T defaultValue,
            std::vector<IProperty*>& properties,
            const std::string& groupName)
            : _name(qualifiedName(name, groupName)),
              _value(std::move(defaultValue)),
              _mandatory(false)
        {
            properties.push_back(this);
        }

        PropertyImpl(const char* name, std::vector<IProperty*>& properties, const std::string& groupName)
            : _name(qualifiedName(name, groupName)),
              _value(),
              _mandatory(true)
        {
            properties.push_back(this);
        }

        const T& get() const { return _value; }
        operator const T&() const { return _value; }

        bool read(const nlohmann::json& document) override
        {
            auto it = document.find(_name);
            if (it == document.end() || it->is_null())
            {
                if (_mandatory)
                {
                    _value = T();
                    return false;
                }
                return true;
            }

            _value = it->template get<T>();
            return true;
        }

        void write(nlohmann::json& document) const override { document[_name] = _value; }

        const std::string& getName() const override { return _name; }

    private:
        static std::string qualifiedName(const char* name, const std::string& groupName)
        {
            return groupName.empty() ? std::string(name) : groupName + "." + name;
        }

        const std::string _name;
        T _value;
        const bool _mandatory;
    };

    std::vector<IProperty*> _properties;
    std::string _groupName;

private:
    bool parse(const std::string& json);
};

} // namespace config

#define CFG_CONCAT_IMPL(x, y) x##y
#define CFG_CONCAT(x, y) CFG_CONCAT_IMPL(x, y)

#define CFG_GROUP()                                                                                                    \
    struct CFG_CONCAT(Group, __LINE__)                                                                                 \
    {                                                                                                                  \
        const std::string _groupName;                                                                                  \
        std::vector<IProperty*>& _properties;                                                                          \
        CFG_CONCAT(Group, __LINE__)                                                                                    \
        (const std::string& parent, const std::string& name, std::vector<IProperty*>& properties)                      \
            : _groupName(parent.empty() ? name : parent + "." + name),                                                 \
              _properties(properties)                                                                                  \
        {                                                                                                              \
        }
#define CFG_GROUP_END(name)                                                                                            \
    }                                                                                                                  \
    name{_groupName, #name, _properties};

#define CFG_PROP(type, name, defaultValue) PropertyImpl<type> name = {#name, defaultValue, _properties, _groupName}

#define CFG_MANDATORY_PROP(type, name) PropertyImpl<type> name = {#name, _properties, _groupName}
