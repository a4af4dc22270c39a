#pragma once
#include <sjson/build_version.hpp>
#include <sjson/object_streamer.hpp>
#include <sjson/streamer.hpp>
