// Public header for the vcsv library
#pragma once

#include <vcsv/cancellation.h>
#include <vcsv/decoder.h>
#include <vcsv/errors.h>
#include <vcsv/field_path.h>
#include <vcsv/layout.h>
#include <vcsv/reader.h>
#include <vcsv/record.h>
#include <vcsv/schema.h>
#include <vcsv/source.h>
#include <vcsv/tokenizer.h>
