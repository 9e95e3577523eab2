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
#pragma once

#include <relic/chain/account_object.hpp>
#include <relic/chain/asset_registry.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/genesis_state.hpp>
#include <relic/chain/evaluator.hpp>
#include <relic/chain/operation_history_object.hpp>

#include <relic/db/object_database.hpp>
#include <relic/db/object.hpp>
#include <relic/db/simple_index.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace relic { namespace chain {
   using relic::db::abstract_object;
   using relic::db::object;
   class op_evaluator;
   class transaction_evaluation_state;
   class nft_object;
   class listing_object;
   class marketplace_statistics_object;

   /**
    *   @class database
    *   @brief tracks the state of the settlement engines in an extensible manner
    *
    *   Transactions are the only way to change the state.  Each one is applied inside an undo
    *   session, so a transaction either applies completely or leaves no trace.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Create the reserved accounts, the engine settings and the initial balances
          *
          * Must be called once on a fresh database, before any transaction is pushed.
          */
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         /**
          * @brief Advance the time seen by the engines
          *
          * Time supplied by the host is monotonic; moving it backwards is rejected.
          */
         void set_head_time( time_point_sec t );

         //////////////////// db_getter.cpp ////////////////////

         time_point_sec                         head_time()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const engine_settings_object&          get_engine_settings( engine_type engine )const;
         const marketplace_statistics_object&   get_marketplace_statistics()const;

         const account_object*                  find_account_by_name( const string& name )const;
         const account_object&                  get_account_by_name( const string& name )const;
         const nft_object*                      find_nft( asset_registry_id_type registry, token_id_type token_id )const;
         /// the active listing of a token, if any; expiry is not considered
         const listing_object*                  find_active_listing( asset_registry_id_type registry,
                                                                     token_id_type token_id )const;

         //////////////////// db_init.cpp ////////////////////
         ///@{

         /// Reset the object graph in-memory
         void initialize_indexes(); // Mark as public since it is used in tests
      private:
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }
         ///@}

         //////////////////// db_balance.cpp ////////////////////

      public:
         /**
          * @brief Retrieve a particular account's balance of the native currency
          * @param owner Account whose balance should be retrieved
          * @return owner's balance, zero when the account never held funds
          */
         share_type get_balance( account_id_type owner )const;

         /**
          * @brief Adjust a particular account's balance by a delta
          * @param account ID of account whose balance should be adjusted
          * @param delta Amount to adjust balance by, the balance may not become negative
          */
         void adjust_balance( account_id_type account, share_type delta );

         /// moves funds between two accounts, a no-op for a zero amount
         void transfer_balance( account_id_type from, account_id_type to, share_type amount );

         //////////////////// db_registry.cpp ////////////////////

         /**
          * @brief Obtain the asset registry that serves a registry id
          *
          * Registries bound with @ref set_asset_registry_factory are built by their factory, all
          * others are served by the native registry.  The returned object refers to this database
          * and must not outlive it.
          */
         std::unique_ptr<asset_registry> get_asset_registry( asset_registry_id_type id );

         /**
          * @brief Bind a registry id to a host supplied registry implementation
          *
          * The registry must exist as an asset_registry_object.
          */
         void set_asset_registry_factory( asset_registry_id_type id, asset_registry_factory factory );

         //////////////////// db_royalty.cpp ////////////////////

         /**
          * @brief Resolve the royalty due on a sale
          *
          * Resolution order: the registry's own royalty answer when it is capped and names an
          * existing account, then the token, registry and default overrides.  A registry that
          * fails while answering is treated as silent.
          */
         royalty_info get_royalty( asset_registry_id_type registry, token_id_type token_id, share_type sale_price );

         //////////////////// db_block.cpp ////////////////////

         /**
          * @brief Apply a transaction atomically
          *
          * On success the applied operations are reported through @ref applied_operation.  On
          * failure the exception is rethrown after every effect of the transaction was undone.
          */
         processed_transaction push_transaction( const transaction& trx );

         /**
          *  This method validates transactions without changing the state.
          *  @return the transaction with the results it would produce
          */
         processed_transaction validate_transaction( const transaction& trx );

         /**
          *  This method is used to track applied operations during the evaluation of a transaction, these
          *  operations should include any operation actually included in a transaction as well
          *  as any implied/virtual operations that resulted, such as completing an escrow.  The
          *  applied operations are cleared before applying each transaction.
          *  @param op The operation to push
          *
          *  @return the op_id which can be used to set the result after it has finished being applied.
          */
         uint32_t  push_applied_operation( const operation& op );
         void      set_applied_operation_result( uint32_t op_id, const operation_result& r );
         const vector<optional< operation_history_object > >& get_applied_operations()const;

         /**
          *  This signal is emitted for each operation and virtual operation of a transaction,
          *  in order, after the transaction has been committed.
          */
         fc::signal<void(const operation_history_object&)>  applied_operation;

      private:
         vector< unique_ptr<op_evaluator> >     _operation_evaluators;

         operation_result      apply_operation( transaction_evaluation_state& eval_state, const operation& op );
         processed_transaction _apply_transaction( const transaction& trx );
         void                  notify_applied_operations();

         vector<optional<operation_history_object> >  _applied_ops;

         uint16_t                          _current_op_in_trx = 0;
         uint16_t                          _current_virtual_op = 0;

         flat_map<asset_registry_id_type, asset_registry_factory>  _registry_factories;
   };

   /**
    * @brief The share of an amount given in basis points, rounded down
    *
    * Used for fees and royalties: amount * bps / RELIC_100_PERCENT computed without overflow.
    */
   share_type cut_fee( share_type amount, uint16_t bps );

} }
