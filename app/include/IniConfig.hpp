#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <fstream>
#include <map>
#include <string>

class IniConfig {
public:
    bool load(const std::string &filename);
    bool save(const std::string &filename) const;

    std::string getValue(const std::string &section, const std::string &key,
                         const std::string &default_value = "") const;
    void setValue(const std::string &section, const std::string &key, const std::string &value);
    bool hasValue(const std::string& section, const std::string& key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
