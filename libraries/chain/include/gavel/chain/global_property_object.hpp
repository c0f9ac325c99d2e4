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
#pragma once
#include <gavel/chain/protocol/chain_parameters.hpp>
#include <gavel/chain/protocol/types.hpp>
#include <gavel/db/generic_index.hpp>

namespace gavel { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains global state information (engine parameters, current time)
    * @ingroup object
    * @ingroup implementation
    *
    * This is an implementation detail. The parameters are set from the genesis state; time only
    * moves forward and is what lot start and conclusion are compared against.
    */
   class global_property_object : public gavel::db::abstract_object<global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_global_property_object_type;

         chain_parameters           parameters;
         time_point_sec             time;
   };

   typedef primary_index< global_property_object > global_property_index;

} } // gavel::chain

FC_REFLECT_DERIVED( gavel::chain::global_property_object, (gavel::db::object),
                    (parameters)
                    (time)
                  )
