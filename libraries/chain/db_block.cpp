/*
 * Copyright (c) 2017 Cryptonomex, Inc., and contributors.
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
#include <relic/chain/database.hpp>

#include <relic/chain/evaluator.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/transaction_evaluation_state.hpp>

namespace relic { namespace chain {

processed_transaction database::push_transaction( const transaction& trx )
{ try {
   _applied_ops.clear();
   processed_transaction result;
   try {
      auto session = _undo_db.start_undo_session();
      result = _apply_transaction( trx );
      session.commit();
   } catch( const fc::exception& e ) {
      dlog( "transaction rejected: ${e}", ("e", e.to_string()) );
      _applied_ops.clear();
      throw;
   }
   notify_applied_operations();
   return result;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::validate_transaction( const transaction& trx )
{
   _applied_ops.clear();
   auto session = _undo_db.start_undo_session();
   auto result = _apply_transaction( trx );
   _applied_ops.clear();
   return result;
}

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back(op);
   operation_history_object& oh = *(_applied_ops.back());
   oh.op_in_trx    = _current_op_in_trx;
   oh.virtual_op   = _current_virtual_op++;
   oh.time         = head_time();
   return _applied_ops.size() - 1;
}
void database::set_applied_operation_result( uint32_t op_id, const operation_result& result )
{
   FC_ASSERT( op_id < _applied_ops.size(), "Unknown applied operation ${id}", ("id", op_id) );
   if( _applied_ops[op_id] )
      _applied_ops[op_id]->result = result;
   else
   {
      elog( "Could not set operation result (op_id=${i})", ("i", op_id) );
   }
}

const vector<optional< operation_history_object > >& database::get_applied_operations() const
{
   return _applied_ops;
}

//////////////////// private methods ////////////////////

processed_transaction database::_apply_transaction( const transaction& trx )
{ try {
   trx.validate();

   transaction_evaluation_state eval_state(this);
   eval_state._trx = &trx;

   processed_transaction ptrx(trx);
   _current_op_in_trx = 0;
   for( const auto& op : ptrx.operations )
   {
      _current_virtual_op = 0;
      eval_state.operation_results.emplace_back(apply_operation(eval_state, op));
      ++_current_op_in_trx;
   }
   ptrx.operation_results = std::move(eval_state.operation_results);

   // Number the applied operations, still inside the session of the transaction
   modify( get_dynamic_global_properties(), [this]( dynamic_global_property_object& p ) {
      for( auto& oh : _applied_ops )
         if( oh.valid() )
            oh->sequence = p.next_operation_sequence++;
   });

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation(transaction_evaluation_state& eval_state, const operation& op)
{ try {
   int i_which = op.which();
   FC_ASSERT( i_which >= 0, "Negative operation tag" );
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( u_which < _operation_evaluators.size() && _operation_evaluators[ u_which ],
              "No registered evaluator for this operation" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   auto op_id = push_applied_operation( op );
   auto result = eval->evaluate( eval_state, op, true );
   set_applied_operation_result( op_id, result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::notify_applied_operations()
{
   for( const auto& oh : _applied_ops )
   {
      if( !oh.valid() )
         continue;
      try {
         applied_operation( *oh );
      } catch( const fc::exception& e ) {
         elog( "Caught exception in applied_operation observer: ${e}", ("e", e.to_detail_string()) );
      }
   }
}

} }
