// pattern_registration.hpp
#pragma once
#include "pattern_registry.hpp"

#define REGISTER_PATTERN(CLASSNAME) \
    namespace { \
        struct CLASSNAME##_AutoRegister { \
            CLASSNAME##_AutoRegister() { \
                PatternRegistry::instance().registerPattern([]() { \
                    return std::make_unique<CLASSNAME>(); \
                }); \
            } \
        }; \
        static CLASSNAME##_AutoRegister global_##CLASSNAME##_AutoRegister; \
    }
