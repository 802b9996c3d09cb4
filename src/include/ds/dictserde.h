#pragma once

#include <ds/dictionary.h>
#include <ds/json.h>
#include <ds/path.h>
#include <ds/errors.h>
#include <ds/descriptor.h>
#include <ds/profile.h>
#include <ds/structure.h>
#include <ds/registry.h>
#include <ds/decode.h>
#include <ds/encode.h>
