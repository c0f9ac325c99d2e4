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
#include <gavel/db/object_database.hpp>

namespace gavel { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   _index.resize(255);
}

object_database::~object_database(){}

const object* object_database::find_object( object_id_type id )const
{
   return get_index(id.space(),id.type()).find( id );
}

const object& object_database::get_object( object_id_type id )const
{
   return get_index(id.space(),id.type()).get( id );
}

const index& object_database::get_index(uint8_t space_id, uint8_t type_id)const
{
   FC_ASSERT( _index.size() > space_id, "", ("file",__FILE__)("line",__LINE__) );
   FC_ASSERT( _index[space_id].size() > type_id, "", ("space_id",uint64_t(space_id))("type_id",uint64_t(type_id)) );
   const auto& tmp = _index[space_id][type_id];
   FC_ASSERT( tmp, "No index registered for ${s}.${t}", ("s",uint64_t(space_id))("t",uint64_t(type_id)) );
   return *tmp;
}

index& object_database::get_mutable_index(uint8_t space_id, uint8_t type_id)
{
   FC_ASSERT( _index.size() > space_id, "", ("file",__FILE__)("line",__LINE__) );
   FC_ASSERT( _index[space_id].size() > type_id , "", ("space_id",uint64_t(space_id))("type_id",uint64_t(type_id)) );
   const auto& idx = _index[space_id][type_id];
   FC_ASSERT( idx, "No index registered for ${s}.${t}", ("s",uint64_t(space_id))("t",uint64_t(type_id)) );
   return *idx;
}

void object_database::remove( const object& obj )
{
   _undo_db.on_remove( obj );
   get_mutable_index(obj.id).remove( obj );
}

} } // gavel::db
