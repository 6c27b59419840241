#pragma once

#include <string>
#include <string_view>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trim_copy(std::string_view str);
    static bool is_blank(std::string_view str);
    static std::string join(const std::vector<std::string>& items, const std::string& separator);
};
