#ifndef TTGLYPH_ASSERT_HPP
#define TTGLYPH_ASSERT_HPP

#ifndef TTGLYPH_ASSERT
#ifndef NDEBUG
#include <cassert>
#define TTGLYPH_ASSERT(x) assert(x)
#else
#define TTGLYPH_ASSERT(x)
#endif
#endif

#endif /* TTGLYPH_ASSERT_HPP */
