/* Copyright (c) 2026 The pdfscrub Authors
 *
 * This file is part of pdfscrub.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PDFSCRUBCONSTANTS_H
#define PDFSCRUBCONSTANTS_H

/*
 * Keep this file 'C' compatible. The values appear in JSON reports and
 * are used as exit-status documentation, so only append new values.
 */

/* Error Codes */

enum pdfscrub_error_code_e {
    pdfscrub_e_success = 0,
    pdfscrub_e_input_not_found,    /* input path is not a readable file */
    pdfscrub_e_parse,              /* the document model could not open a file */
    pdfscrub_e_write,              /* the document model could not save a file */
    pdfscrub_e_sanitization,       /* a sanitizer pass could not produce output */
    pdfscrub_e_all_methods_failed, /* no strategy produced a clean candidate */
};

/* Finding Locations */

/* Where a metadata finding was observed. These correspond to the
 * places a PDF can carry attribution data outside of page content.
 */
enum pdfscrub_location_e {
    pdfscrub_loc_doc_info = 0,
    pdfscrub_loc_xmp,
    pdfscrub_loc_page_metadata,
    pdfscrub_loc_annotation,
    pdfscrub_loc_font,
    pdfscrub_loc_font_descriptor,
    pdfscrub_loc_binary_signature,
};

/* Confidence Levels */

enum pdfscrub_confidence_e {
    pdfscrub_conf_low = 0,
    pdfscrub_conf_high,
};

#endif /* PDFSCRUBCONSTANTS_H */
