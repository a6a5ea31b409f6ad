#ifndef ESCROW_ERROR_HPP
#define ESCROW_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Escrow {

/* Malformed input to contract construction.
 * Nothing is constructed when these are thrown.
 */
class ValidationError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	ValidationError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};
class InvalidKeyLength : public ValidationError {
public:
	InvalidKeyLength(std::string const& role, std::size_t length)
		: ValidationError( "InvalidKeyLength: " + role
				 + " key is " + std::to_string(length)
				 + " bytes, expected 32"
				 ) { }
};
class DuplicateKey : public ValidationError {
public:
	DuplicateKey(std::string const& a, std::string const& b)
		: ValidationError( "DuplicateKey: " + a + " and " + b
				 + " have the same key"
				 ) { }
};
class InvalidTimelock : public ValidationError {
public:
	explicit
	InvalidTimelock(std::string const& msg)
		: ValidationError("InvalidTimelock: " + msg) { }
};
class InvalidAddress : public ValidationError {
public:
	explicit
	InvalidAddress(std::string const& msg)
		: ValidationError("InvalidAddress: " + msg) { }
};

/* A script asked of a tree that does not commit to it.  */
class LeafNotFound : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	LeafNotFound(std::string const& script_hex)
		: Util::BacktraceException<std::invalid_argument>(
			"LeafNotFound: " + script_hex
		  ) { }
};

/* The caller's role may not do what was asked.
 * The contract is unchanged.
 */
class AuthorizationError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	AuthorizationError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};
class NotAuthorized : public AuthorizationError {
public:
	NotAuthorized(std::string const& action, std::string const& role)
		: AuthorizationError( "NotAuthorized: " + role
				    + " cannot initiate " + action
				    ) { }
};
class NotRequired : public AuthorizationError {
public:
	explicit
	NotRequired(std::string const& signer)
		: AuthorizationError( "NotRequired: " + signer
				    + " is not a required signer"
				    ) { }
};

/* The contract is not in a state that allows the operation.
 * The contract is unchanged.
 */
class StateConflictError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	StateConflictError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};
class NoPendingTransaction : public StateConflictError {
public:
	explicit
	NoPendingTransaction(std::string const& address)
		: StateConflictError("NoPendingTransaction: " + address) { }
};
class PendingTransactionExists : public StateConflictError {
public:
	explicit
	PendingTransactionExists(std::string const& address)
		: StateConflictError("PendingTransactionExists: " + address) { }
};
class NotPending : public StateConflictError {
public:
	explicit
	NotPending(std::string const& address)
		: StateConflictError( "NotPending: transaction on "
				    + address + " was rejected"
				    ) { }
};
class AwaitingSignatures : public StateConflictError {
public:
	explicit
	AwaitingSignatures(std::string const& address)
		: StateConflictError("AwaitingSignatures: " + address) { }
};
class AlreadyFunded : public StateConflictError {
public:
	explicit
	AlreadyFunded(std::string const& address)
		: StateConflictError("AlreadyFunded: " + address) { }
};
class NoFunds : public StateConflictError {
public:
	explicit
	NoFunds(std::string const& address)
		: StateConflictError("NoFunds: " + address) { }
};
class UnknownContract : public StateConflictError {
public:
	explicit
	UnknownContract(std::string const& address)
		: StateConflictError("UnknownContract: " + address) { }
};

/* The signer already voted.  The record is unchanged.  */
class AlreadyDone : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	AlreadyDone(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};
class AlreadyApproved : public AlreadyDone {
public:
	explicit
	AlreadyApproved(std::string const& signer)
		: AlreadyDone("AlreadyApproved: " + signer) { }
};
class AlreadyRejected : public AlreadyDone {
public:
	explicit
	AlreadyRejected(std::string const& signer)
		: AlreadyDone("AlreadyRejected: " + signer) { }
};

/* Query, submit or finalize failed.
 * A pending transaction stays pending and can be retried.
 */
class NetworkError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	NetworkError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"NetworkError: " + msg
		  ) { }
};

class SigningError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	SigningError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"SigningError: " + msg
		  ) { }
};

class ConfigError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	ConfigError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"ConfigError: " + msg
		  ) { }
};

}

#endif /* !defined(ESCROW_ERROR_HPP) */
