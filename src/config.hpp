#pragma once

/*compile-time defaults, runtime overrides go through :set and ~/.bvimrc*/

#ifndef BV_INDENT_WIDTH
#define BV_INDENT_WIDTH 2
#endif

#ifndef BV_BULLET_GLYPH
#define BV_BULLET_GLYPH "\xE2\x80\xA2" // U+2022 bullet
#endif

#ifndef BV_RC_NAME
#define BV_RC_NAME ".bvimrc"
#endif

#define BV_MAX_INDENT_WIDTH 8
