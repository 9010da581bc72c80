#pragma once

/*compile-time defaults; runtime guide options live in GuideOptions*/

#ifndef IG_DEFAULT_TAB_WIDTH
#define IG_DEFAULT_TAB_WIDTH 4
#endif

/*chunk size used by TextBuffer::write_file*/
#ifndef IG_WRITE_CHUNK_SIZE
#define IG_WRITE_CHUNK_SIZE (64 * 1024)
#endif

/*upper bound for either side of a bitmap glyph, in pixels*/
#ifndef IG_MAX_GLYPH_PIXELS
#define IG_MAX_GLYPH_PIXELS 4096
#endif

/*longest accepted guidedelay, in seconds*/
#ifndef IG_MAX_REDRAW_DELAY_SECONDS
#define IG_MAX_REDRAW_DELAY_SECONDS 3600
#endif

#define IG_RC_FILE_NAME ".iguiderc"
#define IG_LOG_ENV "IGUIDE_LOG"
