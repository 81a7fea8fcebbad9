#pragma once

// ==============================================================================
// Version Information
// ==============================================================================
// Keep in sync with the project() version in CMakeLists.txt.
// ==============================================================================

#define HARMONIA_MAJOR_VERSION_STR "1"
#define HARMONIA_MAJOR_VERSION_INT 1

#define HARMONIA_SUB_VERSION_STR "0"
#define HARMONIA_SUB_VERSION_INT 0

#define HARMONIA_RELEASE_NUMBER_STR "0"
#define HARMONIA_RELEASE_NUMBER_INT 0

#define HARMONIA_VERSION_STR HARMONIA_MAJOR_VERSION_STR "." HARMONIA_SUB_VERSION_STR "." HARMONIA_RELEASE_NUMBER_STR

#define HARMONIA_PRODUCT_NAME "Harmonia"
#define HARMONIA_PRODUCT_DESCRIPTION "Harmonic signal / noise / moving-average workbench"
