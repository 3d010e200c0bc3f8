#pragma once
// Thin aggregator: everything needed to turn a block tree into entity records.

#include "parser.hpp"
#include "ast/node.hpp"
#include "ast/json.hpp"
#include "document/text.hpp"
#include "document/table.hpp"
#include "document/sections.hpp"
#include "document/versions.hpp"
#include "document/profile.hpp"
#include "revision.hpp"
#include "entity/schema.hpp"
#include "entity/record.hpp"
#include "entity/json.hpp"
#include "entity/index_text.hpp"
