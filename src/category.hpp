#pragma once
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

enum class Category {
    PHONE,
    LANDLINE,
    ID_CARD,
    ADDRESS,
    EMAIL,
    PASSWORD,
    CREDIT_CARD,
    IP_ADDRESS
};

// Selector tag that expands to every Category.
#define CATEGORY_ALL_TAG "all"

class UnknownCategory : public std::invalid_argument {
public:
    explicit UnknownCategory(const std::string& tag)
        : std::invalid_argument("Unknown category: " + tag), tag(tag) {}
    std::string tag;
};

struct CategoryInfo {
    Category category;
    std::string tag;
    std::string displayName;
    std::string description;
};

const std::vector<CategoryInfo>& listCategories();
std::set<Category> allCategories();

std::string categoryTag(Category category);
Category categoryFromTag(const std::string& tag);

// Accepts tags and the "all" selector; throws UnknownCategory on anything else.
std::set<Category> parseCategories(const std::vector<std::string>& tags);
