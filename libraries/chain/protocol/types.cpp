/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <gavel/chain/protocol/types.hpp>

#include <gavel/chain/exceptions.hpp>

#include <fc/exception/exception.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace fc
{
    void to_variant(const gavel::chain::amount_type &var, fc::variant &vo)
    {
        vo = var.str();
    }

    void from_variant(const fc::variant &var, gavel::chain::amount_type &vo)
    {
        try
        {
            if (var.is_uint64() || var.is_int64())
            {
                FC_ASSERT(!var.is_int64() || var.as_int64() >= 0, "amount may not be negative");
                vo = gavel::chain::amount_type(var.as_uint64());
                return;
            }
            const auto &s = var.get_string();
            FC_ASSERT(!s.empty() && s.find_first_not_of("0123456789") == std::string::npos,
                      "amount must be a decimal integer string");
            // parse wide so that values past 128 bits cannot wrap into range
            const boost::multiprecision::cpp_int parsed(s);
            GAVEL_ASSERT(parsed <= boost::multiprecision::cpp_int(GAVEL_MAX_AMOUNT), gavel::chain::overflow_exception,
                         "amount ${a} exceeds the amount width", ("a", s));
            vo = gavel::chain::amount_type(parsed);
        }
        FC_CAPTURE_AND_RETHROW((var))
    }
} // namespace fc
