#ifndef OPLAWS_OPLAWS_HPP
#define OPLAWS_OPLAWS_HPP

#include <oplaws/name.hpp>
#include <oplaws/operations.hpp>
#include <oplaws/variants.hpp>
#include <oplaws/index_space.hpp>
#include <oplaws/bundle.hpp>
#include <oplaws/explorer.hpp>
#include <oplaws/test_info.hpp>
#include <oplaws/tags.hpp>
#include <oplaws/capabilities.hpp>
#include <oplaws/format_error.hpp>
#include <oplaws/describe.hpp>
#include <oplaws/stock.hpp>

#endif // OPLAWS_OPLAWS_HPP
