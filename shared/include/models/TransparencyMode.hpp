/**
 * @file TransparencyMode.hpp
 * Alpha policies for background removal. The two modes are mutually
 * exclusive and always chosen explicitly.
 */
#pragma once

namespace squarify {

enum class TransparencyMode
{
    SimilarityFalloff = 0, // alpha = max channel distance to the target colour
    ExactMatch = 1,        // binary alpha, only the exact colour is removed
};

}
