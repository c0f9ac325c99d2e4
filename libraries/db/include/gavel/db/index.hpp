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
#include <gavel/db/object.hpp>

#include <functional>

namespace gavel { namespace db {

   /**
    * @class index
    * @brief abstract base class for accessing objects indexed in various ways.
    *
    * All indexes assume that there exists an object ID space that will grow
    * forever in a seqential manner.  These IDs are used to identify the
    * index, type, and instance of the object.
    *
    * Items in an index can only be modified via a call to modify and
    * all references to objects outside of the modify() method are
    * const references.
    *
    * Insertion and removal of objects is recorded by the object_database,
    * the index itself knows nothing about undo.
    */
   class index
   {
      public:
         virtual ~index(){}

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          *  Builds a new object and assigns it the next available ID and then
          *  initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Used by the undo logic to restore a removed object with its original id.
          */
         virtual const object&  insert( object&& obj ) = 0;

         /**
          * Opens the object for modification; the modifier must not change the id.
          */
         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         /**
          *  @return a pointer to the object with the given id, or nullptr
          */
         virtual const object*  find( object_id_type id )const = 0;

         /**
          * This version will throw if the object is not found
          */
         const object&          get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object ${id}", ("id",id) );
            return *maybe_found;
         }

         virtual void           inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
   };

} } // gavel::db
