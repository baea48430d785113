#pragma once

#define PRIMITIVE_STRINGIFY(...) #__VA_ARGS__
#define STRINGIFY(...) PRIMITIVE_STRINGIFY(__VA_ARGS__)
