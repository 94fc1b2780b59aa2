// ┏━┓┏━┓┏┓ ┏━┓┏━┓
// ┣━┫┣┳┛┣┻┓┃ ┃┣┳┛
// ╹ ╹╹┗╸┗━┛┗━┛╹┗╸
//  Typed records <-> generic value trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the arbor developers
#pragma once

#include "arbor/value.hh"
#include "arbor/decimal.hh"
#include "arbor/key_path.hh"
#include "arbor/errors.hh"
#include "arbor/key_case.hh"
#include "arbor/timestamp.hh"
#include "arbor/blob.hh"
#include "arbor/uri.hh"
#include "arbor/strategy.hh"
#include "arbor/coding.hh"
#include "arbor/encoder.hh"
#include "arbor/decoder.hh"
#include "arbor/builtin.hh"
