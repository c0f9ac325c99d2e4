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

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace gavel { namespace db {

   using std::unordered_map;
   using std::unordered_set;

   class object_database;

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Every session records the prior value of each object it touches.  Sessions
    * nest: committing an inner session folds its changes into the enclosing one,
    * so an outer failure still reverts everything the inner session did.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session()
               {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch ( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string() ) );
                     throw; // the database is inconsistent at this point
                  }
               }
               void commit() { _apply_undo = false; _db.commit(); }
               void undo()   { if( _apply_undo ) _db.undo(); _apply_undo = false; }

               session& operator = ( session&& mv )
               { try {
                  if( this == &mv ) return *this;
                  if( _apply_undo ) _db.undo();
                  _apply_undo = mv._apply_undo;
                  mv._apply_undo = false;
                  return *this;
               } FC_CAPTURE_AND_RETHROW() }

            private:
               friend class undo_database;
               session( undo_database& db ):_db(db){}
               undo_database& _db;
               bool _apply_undo = true;
         };

         session start_undo_session();

         void on_create( const object& obj );
         void on_modify( const object& obj );
         void on_remove( const object& obj );

         /**
          *  Removes the last committed session; an enclosing session inherits its changes,
          *  a top level session simply forgets them.
          */
         void commit();

         /**
          *  Reverts all changes made since the last session was started.
          */
         void undo();

         std::size_t size()const { return _stack.size(); }
         bool        enabled()const { return !_disabled; }

      private:
         struct undo_state
         {
            unordered_map<object_id_type, unique_ptr<object> > old_values;
            unordered_map<object_id_type, object_id_type>      old_index_next_ids;
            unordered_set<object_id_type>                      new_ids;
            unordered_map<object_id_type, unique_ptr<object> > removed;
         };

         void merge();

         object_database&       _db;
         std::deque<undo_state> _stack;
         bool                   _disabled = false;
   };

} } // gavel::db
