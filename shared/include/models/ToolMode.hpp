/**
 * @file ToolMode.hpp
 * What a pointer drag does to the stroke buffer.
 */
#pragma once

enum class ToolMode
{
    Draw = 0,
    Erase = 1,
};
