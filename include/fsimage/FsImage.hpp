#pragma once

#include "core/Error.hpp"
#include "dump/TreeDump.hpp"
#include "image/ByteStreams.hpp"
#include "image/CancellationToken.hpp"
#include "image/ImageFiles.hpp"
#include "image/ImageFormat.hpp"
#include "image/ImageLoader.hpp"
#include "image/ImageWriter.hpp"
#include "namespace/Namesystem.hpp"
#include "namespace/NamesystemOptions.hpp"
#include "path/PathUtils.hpp"
#include "tools/ImageJsonExporter.hpp"
